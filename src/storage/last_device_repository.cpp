#include "storage/last_device_repository.h"
#include "types/internal/json_serializer.h"
#include "utils/logger.h"
#include "utils/utils.h"

namespace llink
{
    LastDeviceRepository::LastDeviceRepository(std::shared_ptr<ILastDeviceStore> store)
        : store_(std::move(store))
    {
    }

    VoidResult LastDeviceRepository::save(const LastDevice &device)
    {
        if (device.address.empty())
        {
            return VoidResult::Error(LLINK_ERROR_CODE::INVALID_PARAMETER, "Device address must not be empty");
        }

        try
        {
            nlohmann::json document = device;
            if (!store_->save(STORAGE_KEY, document.dump()))
            {
                LABEL_LOG_WARN("Last device store rejected the write");
                return VoidResult::Error(LLINK_ERROR_CODE::UNKNOWN_ERROR, "Failed to save last device");
            }
        }
        catch (const std::exception &e)
        {
            LABEL_LOG_ERROR("Failed to save last device: {}", e.what());
            return VoidResult::Error(LLINK_ERROR_CODE::UNKNOWN_ERROR, std::string("Failed to save last device: ") + e.what());
        }

        LABEL_LOG_DEBUG("Saved last device {}", StringUtils::maskString(device.address));
        return VoidResult::Success();
    }

    BizResult<LastDevice> LastDeviceRepository::load()
    {
        std::optional<std::string> stored;
        try
        {
            stored = store_->load(STORAGE_KEY);
        }
        catch (const std::exception &e)
        {
            LABEL_LOG_ERROR("Failed to read last device: {}", e.what());
            return BizResult<LastDevice>::Error(LLINK_ERROR_CODE::UNKNOWN_ERROR, std::string("Failed to read last device: ") + e.what());
        }

        if (!stored || stored->empty())
        {
            return BizResult<LastDevice>::Error(LLINK_ERROR_CODE::PRINTER_NOT_FOUND, "No last device stored");
        }

        try
        {
            LastDevice device = nlohmann::json::parse(*stored).get<LastDevice>();
            if (device.address.empty())
            {
                return BizResult<LastDevice>::Error(LLINK_ERROR_CODE::PRINTER_NOT_FOUND, "Stored last device has no address");
            }
            return BizResult<LastDevice>::Ok(device);
        }
        catch (const nlohmann::json::exception &e)
        {
            LABEL_LOG_WARN("Stored last device is not valid JSON: {}", e.what());
            return BizResult<LastDevice>::Error(LLINK_ERROR_CODE::INVALID_PARAMETER, "Stored last device is corrupt");
        }
    }

    VoidResult LastDeviceRepository::clear()
    {
        try
        {
            if (!store_->remove(STORAGE_KEY))
            {
                LABEL_LOG_DEBUG("No last device to clear");
            }
        }
        catch (const std::exception &e)
        {
            LABEL_LOG_ERROR("Failed to clear last device: {}", e.what());
            return VoidResult::Error(LLINK_ERROR_CODE::UNKNOWN_ERROR, std::string("Failed to clear last device: ") + e.what());
        }
        return VoidResult::Success();
    }

    // ========== InMemoryLastDeviceStore ==========

    std::optional<std::string> InMemoryLastDeviceStore::load(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    bool InMemoryLastDeviceStore::save(const std::string &key, const std::string &value)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
        return true;
    }

    bool InMemoryLastDeviceStore::remove(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.erase(key) > 0;
    }
} // namespace llink
