#pragma once

#include <map>
#include <memory>
#include <mutex>
#include "platform/last_device_store.h"
#include "types/biz.h"

namespace llink
{
    /**
     * Stores the last connected device as JSON under STORAGE_KEY
     */
    class LastDeviceRepository
    {
    public:
        static constexpr const char *STORAGE_KEY = "label_link.last_device";

        explicit LastDeviceRepository(std::shared_ptr<ILastDeviceStore> store);

        VoidResult save(const LastDevice &device);

        /**
         * @return PRINTER_NOT_FOUND if nothing is stored
         */
        BizResult<LastDevice> load();

        VoidResult clear();

    private:
        std::shared_ptr<ILastDeviceStore> store_;
    };

    /**
     * Process-local store, used when the platform supplies none
     */
    class InMemoryLastDeviceStore : public ILastDeviceStore
    {
    public:
        std::optional<std::string> load(const std::string &key) override;
        bool save(const std::string &key, const std::string &value) override;
        bool remove(const std::string &key) override;

    private:
        std::mutex mutex_;
        std::map<std::string, std::string> values_;
    };
} // namespace llink
