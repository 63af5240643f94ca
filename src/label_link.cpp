#include "label_link.h"
#include "connection/connection_manager.h"
#include "core/event_reconciler.h"
#include "discovery/discovery_coordinator.h"
#include "discovery/network_discovery_source.h"
#include "discovery/radio_discovery_source.h"
#include "print/print_executor.h"
#include "print/printer_commands.h"
#include "storage/last_device_repository.h"
#include "transport/transport_factory.h"
#include "utils/logger.h"
#include "utils/thread_pool.h"
#include "utils/utils.h"
#include <atomic>
#include <mutex>

namespace llink
{
    namespace
    {
        constexpr size_t IO_POOL_THREADS = 4;
        constexpr size_t CALLER_POOL_THREADS = 2;

        template <typename T>
        std::future<T> readyFuture(T value)
        {
            std::promise<T> promise;
            promise.set_value(std::move(value));
            return promise.get_future();
        }
    } // namespace

    // ========== Private Implementation Class ==========
    class LabelLink::Impl
    {
    public:
        enum class State
        {
            UNINITIALIZED,
            READY,
            DISPOSED,
        };

        explicit Impl(std::shared_ptr<EventBus> eventBus) : eventBus_(std::move(eventBus)) {}

        ~Impl()
        {
            dispose();
        }

        VoidResult initialize(const LabelLink::Config &config, const PlatformBindings &platform)
        {
            std::lock_guard<std::mutex> lock(lifecycleMutex_);
            if (state_ == State::READY)
            {
                LABEL_LOG_WARN("LabelLink already initialized");
                return VoidResult::Success();
            }
            if (state_ == State::DISPOSED)
            {
                return VoidResult::Error(LLINK_ERROR_CODE::DISPOSED, "LabelLink has been disposed");
            }
            config_ = config;

            LogConfig logConfig;
            logConfig.level = config.enableDebugLogging ? LogLevel::DEBUG : Logger::levelFromInt(config.log.logLevel);
            logConfig.enableConsole = config.log.logEnableConsole;
            logConfig.enableFile = config.log.logEnableFile;
            logConfig.fileName = config.log.logFileName;
            logConfig.maxFileSize = config.log.logMaxFileSize;
            logConfig.maxFiles = config.log.logMaxFiles;
            if (!Logger::getInstance().initialize(logConfig))
            {
                return VoidResult::Error(LLINK_ERROR_CODE::UNKNOWN_ERROR, "Failed to initialize logging");
            }

            ioPool_ = std::make_unique<ThreadPool>(IO_POOL_THREADS, 0, ThreadPool::RejectionPolicy::BLOCK);
            callerPool_ = std::make_unique<ThreadPool>(CALLER_POOL_THREADS, 0, ThreadPool::RejectionPolicy::BLOCK);
            reconciler_ = std::make_unique<EventReconciler>(eventBus_);

            EventReconciler *reconciler = reconciler_.get();
            auto sink = [reconciler](CoreEvent event)
            {
                return reconciler->post(std::move(event));
            };

            std::shared_ptr<ITransportFactory> transportFactory = platform.transportFactory;
            if (!transportFactory)
            {
                transportFactory = std::make_shared<DefaultTransportFactory>(config.connection, config.print,
                                                                             platform.radioTransportFactory);
            }
            connection_ = std::make_unique<ConnectionManager>(config.connection, transportFactory, *ioPool_, sink);

            ConnectionManager *connection = connection_.get();
            reconciler_->setConnectionStateProvider([connection]()
                                                    { return connection->getState(); });

            printer_ = std::make_unique<PrintExecutor>(config.print, *connection_, *reconciler_, *ioPool_);

            discovery_ = std::make_unique<DiscoveryCoordinator>(config.discovery, sink);
            if (!platform.discoverySources.empty())
            {
                for (const auto &source : platform.discoverySources)
                {
                    discovery_->addSource(source);
                }
            }
            else
            {
                if (platform.radioScanner)
                {
                    discovery_->addSource(std::make_shared<RadioDiscoverySource>(platform.radioScanner));
                }
                discovery_->addSource(std::make_shared<NetworkDiscoverySource>(config.discovery));
            }

            auto store = platform.lastDeviceStore ? platform.lastDeviceStore : std::make_shared<InMemoryLastDeviceStore>();
            lastDevice_ = std::make_unique<LastDeviceRepository>(store);

            state_ = State::READY;
            LABEL_LOG_INFO("LabelLink {} initialized with {} discovery sources",
                           SDKVersion::getVersionString(), discovery_->sourceCount());

            if (config.autoConnectLastPrinter)
            {
                scheduleAutoConnect();
            }
            return VoidResult::Success();
        }

        void dispose()
        {
            {
                std::lock_guard<std::mutex> lock(lifecycleMutex_);
                if (state_ != State::READY)
                {
                    state_ = State::DISPOSED;
                    return;
                }
                state_ = State::DISPOSED;
            }
            LABEL_LOG_INFO("Disposing LabelLink");

            discovery_->shutdown();

            if (!reconciler_->post(CoreEvent::cancelPrintJobs("LabelLink disposed")))
            {
                LABEL_LOG_DEBUG("Reconciler already stopped, no jobs cancelled");
            }

            VoidResult disconnected = connection_->disconnect();
            if (!disconnected.isSuccess())
            {
                LABEL_LOG_WARN("Disconnect during dispose failed: {}", disconnected.message);
            }

            callerPool_->shutdown();
            ioPool_->shutdown();
            reconciler_->drain();
            reconciler_->stop();
            LABEL_LOG_INFO("LabelLink disposed");
        }

        State getState() const { return state_.load(); }

        VoidResult checkReady() const
        {
            switch (state_.load())
            {
            case State::READY:
                return VoidResult::Success();
            case State::DISPOSED:
                return VoidResult::Error(LLINK_ERROR_CODE::DISPOSED, "LabelLink has been disposed");
            case State::UNINITIALIZED:
            default:
                return VoidResult::Error(LLINK_ERROR_CODE::NOT_INITIALIZED, "LabelLink is not initialized");
            }
        }

        bool isReady() const { return state_.load() == State::READY; }

        // ========== Connection ==========

        VoidResult connect(const std::string &address, std::optional<PrinterFamily> family)
        {
            VoidResult ready = checkReady();
            if (!ready.isSuccess())
            {
                return ready;
            }

            const PrinterFamily resolved = family.value_or(PrinterFamily::SMART_PRINTER);
            VoidResult result = connection_->connect(address, resolved);
            if (result.isSuccess())
            {
                ConnectionState state = connection_->getState();
                if (state.isConnected() && state.address && *state.address == address)
                {
                    rememberDevice(address, resolved);
                }
            }
            return result;
        }

        VoidResult disconnect()
        {
            VoidResult ready = checkReady();
            if (!ready.isSuccess())
            {
                return ready;
            }
            return connection_->disconnect();
        }

        template <typename T, typename F>
        std::future<T> runAsync(F &&func)
        {
            VoidResult ready = checkReady();
            if (!ready.isSuccess())
            {
                return readyFuture<T>(T(ready));
            }
            try
            {
                return callerPool_->enqueue(std::forward<F>(func));
            }
            catch (const std::runtime_error &e)
            {
                LABEL_LOG_WARN("Async operation rejected: {}", e.what());
                return readyFuture<T>(T(LLINK_ERROR_CODE::DISPOSED, "LabelLink has been disposed"));
            }
        }

        // ========== Printing ==========

        BizResult<PrintJob> print(const std::string &payload, const std::optional<std::string> &jobId)
        {
            VoidResult ready = checkReady();
            if (!ready.isSuccess())
            {
                return BizResult<PrintJob>(ready);
            }
            return printer_->print(payload, jobId);
        }

        VoidResult configure(std::optional<MediaType> mediaType, std::optional<int> darkness, bool calibrate)
        {
            VoidResult ready = checkReady();
            if (!ready.isSuccess())
            {
                return ready;
            }
            if (!mediaType && !darkness && !calibrate)
            {
                return VoidResult::Error(LLINK_ERROR_CODE::INVALID_PARAMETER, "Nothing to configure");
            }

            std::string commands;
            if (mediaType)
            {
                commands += PrinterCommands::mediaType(*mediaType);
            }
            if (darkness)
            {
                auto command = PrinterCommands::darkness(*darkness);
                if (!command.isSuccess())
                {
                    return VoidResult(command.code, command.message);
                }
                commands += command.value();
            }
            if (calibrate)
            {
                commands += PrinterCommands::calibrate();
            }

            auto result = printer_->print(commands);
            return VoidResult(result.code, result.message);
        }

        bool toggleRotation()
        {
            if (!isReady())
            {
                return false;
            }
            return printer_->toggleRotation();
        }

        bool isRotated() const
        {
            return isReady() && printer_->isRotated();
        }

        // ========== Reads through the reconciler ==========

        template <typename T, typename F>
        T readThroughReconciler(F &&func, T fallback) const
        {
            if (!isReady())
            {
                return fallback;
            }
            try
            {
                return reconciler_->submit(std::forward<F>(func)).get();
            }
            catch (const std::runtime_error &e)
            {
                LABEL_LOG_DEBUG("Read skipped: {}", e.what());
                return fallback;
            }
        }

        VoidResult removePrinter(const std::string &address)
        {
            VoidResult ready = checkReady();
            if (!ready.isSuccess())
            {
                return ready;
            }
            VoidResult valid = ConnectionManager::validateAddress(address);
            if (!valid.isSuccess())
            {
                return valid;
            }
            try
            {
                if (!reconciler_->removeDevice(address))
                {
                    return VoidResult::Error(LLINK_ERROR_CODE::PRINTER_NOT_FOUND, "Printer not found: " + address);
                }
            }
            catch (const std::runtime_error &e)
            {
                return VoidResult::Error(LLINK_ERROR_CODE::DISPOSED, e.what());
            }
            LABEL_LOG_INFO("Removed printer {}", StringUtils::maskString(address));
            return VoidResult::Success();
        }

        VoidResult clearPrinters()
        {
            VoidResult ready = checkReady();
            if (!ready.isSuccess())
            {
                return ready;
            }
            try
            {
                reconciler_->clearDevices();
            }
            catch (const std::runtime_error &e)
            {
                return VoidResult::Error(LLINK_ERROR_CODE::DISPOSED, e.what());
            }
            return VoidResult::Success();
        }

        // ========== Last device ==========

        void rememberDevice(const std::string &address, PrinterFamily family)
        {
            LastDevice last;
            last.address = address;
            last.family = family;
            std::optional<Device> known = reconciler_->registry().find(address);
            last.displayName = known ? known->displayName : address;
            last.isWifi = known ? known->isWifi : !isRadioAddress(address);

            VoidResult saved = lastDevice_->save(last);
            if (!saved.isSuccess())
            {
                LABEL_LOG_WARN("Failed to remember last printer: {}", saved.message);
            }
        }

        void scheduleAutoConnect()
        {
            BizResult<LastDevice> last = lastDevice_->load();
            if (!last.isSuccess())
            {
                LABEL_LOG_INFO("No last printer to reconnect: {}", last.message);
                return;
            }

            LastDevice device = last.value();
            LABEL_LOG_INFO("Reconnecting to last printer {}", StringUtils::maskString(device.address));
            try
            {
                callerPool_->enqueue([this, device]()
                                     {
                    VoidResult result = connect(device.address, device.family);
                    if (!result.isSuccess())
                    {
                        LABEL_LOG_WARN("Reconnect to last printer failed: {}", result.message);
                    } });
            }
            catch (const std::runtime_error &e)
            {
                LABEL_LOG_WARN("Cannot schedule reconnect: {}", e.what());
            }
        }

        LabelLink::Config config_;
        std::shared_ptr<EventBus> eventBus_;

        std::mutex lifecycleMutex_;
        std::atomic<State> state_{State::UNINITIALIZED};

        std::unique_ptr<ThreadPool> ioPool_;
        std::unique_ptr<ThreadPool> callerPool_;
        std::unique_ptr<EventReconciler> reconciler_;
        std::unique_ptr<ConnectionManager> connection_;
        std::unique_ptr<PrintExecutor> printer_;
        std::unique_ptr<DiscoveryCoordinator> discovery_;
        std::unique_ptr<LastDeviceRepository> lastDevice_;
    };

    // ========== LabelLink Implementation ==========

    LabelLink::LabelLink()
        : eventBus_(std::make_shared<EventBus>()), pImpl_(std::make_unique<Impl>(eventBus_))
    {
    }

    LabelLink::~LabelLink() = default;

    VoidResult LabelLink::initialize(const Config &config, const PlatformBindings &platform)
    {
        return pImpl_->initialize(config, platform);
    }

    void LabelLink::dispose()
    {
        pImpl_->dispose();
    }

    bool LabelLink::isInitialized() const
    {
        return pImpl_->getState() == Impl::State::READY;
    }

    bool LabelLink::isDisposed() const
    {
        return pImpl_->getState() == Impl::State::DISPOSED;
    }

    BizResult<DiscoverySession> LabelLink::startDiscovery()
    {
        VoidResult ready = pImpl_->checkReady();
        if (!ready.isSuccess())
        {
            return BizResult<DiscoverySession>(ready);
        }
        return pImpl_->discovery_->startDiscovery();
    }

    VoidResult LabelLink::stopDiscovery()
    {
        VoidResult ready = pImpl_->checkReady();
        if (!ready.isSuccess())
        {
            return ready;
        }
        return pImpl_->discovery_->stopDiscovery();
    }

    std::optional<DiscoverySession> LabelLink::getCurrentSession() const
    {
        EventReconciler *reconciler = pImpl_->reconciler_.get();
        return pImpl_->readThroughReconciler<std::optional<DiscoverySession>>(
            [reconciler]()
            { return reconciler->getCurrentSession(); },
            std::nullopt);
    }

    VoidResult LabelLink::connect(const std::string &address, std::optional<PrinterFamily> family)
    {
        return pImpl_->connect(address, family);
    }

    VoidResult LabelLink::disconnect()
    {
        return pImpl_->disconnect();
    }

    bool LabelLink::isConnected()
    {
        if (!pImpl_->isReady())
        {
            return false;
        }
        return pImpl_->connection_->isConnected();
    }

    ConnectionState LabelLink::getConnectionState() const
    {
        if (!pImpl_->connection_)
        {
            return ConnectionState{};
        }
        return pImpl_->connection_->getState();
    }

    std::future<VoidResult> LabelLink::connectAsync(const std::string &address, std::optional<PrinterFamily> family)
    {
        Impl *impl = pImpl_.get();
        return pImpl_->runAsync<VoidResult>([impl, address, family]()
                                            { return impl->connect(address, family); });
    }

    std::future<VoidResult> LabelLink::disconnectAsync()
    {
        Impl *impl = pImpl_.get();
        return pImpl_->runAsync<VoidResult>([impl]()
                                            { return impl->disconnect(); });
    }

    BizResult<PrintJob> LabelLink::print(const std::string &payload, const std::optional<std::string> &jobId)
    {
        return pImpl_->print(payload, jobId);
    }

    std::future<BizResult<PrintJob>> LabelLink::printAsync(const std::string &payload, const std::optional<std::string> &jobId)
    {
        Impl *impl = pImpl_.get();
        return pImpl_->runAsync<BizResult<PrintJob>>([impl, payload, jobId]()
                                                     { return impl->print(payload, jobId); });
    }

    VoidResult LabelLink::configure(std::optional<MediaType> mediaType, std::optional<int> darkness, bool calibrate)
    {
        return pImpl_->configure(mediaType, darkness, calibrate);
    }

    bool LabelLink::toggleRotation()
    {
        return pImpl_->toggleRotation();
    }

    bool LabelLink::isRotated() const
    {
        return pImpl_->isRotated();
    }

    std::vector<Device> LabelLink::getDevices() const
    {
        EventReconciler *reconciler = pImpl_->reconciler_.get();
        return pImpl_->readThroughReconciler<std::vector<Device>>(
            [reconciler]()
            { return reconciler->registry().getDevices(); },
            {});
    }

    VoidResult LabelLink::removePrinter(const std::string &address)
    {
        return pImpl_->removePrinter(address);
    }

    VoidResult LabelLink::clearPrinters()
    {
        return pImpl_->clearPrinters();
    }

    std::vector<PrintJob> LabelLink::getPrintJobs() const
    {
        EventReconciler *reconciler = pImpl_->reconciler_.get();
        return pImpl_->readThroughReconciler<std::vector<PrintJob>>(
            [reconciler]()
            { return reconciler->printJobs().getAll(); },
            {});
    }

    std::optional<PrintJob> LabelLink::getPrintJob(const std::string &jobId) const
    {
        EventReconciler *reconciler = pImpl_->reconciler_.get();
        return pImpl_->readThroughReconciler<std::optional<PrintJob>>(
            [reconciler, jobId]()
            { return reconciler->printJobs().get(jobId); },
            std::nullopt);
    }

    VoidResult LabelLink::saveLastDevice(const LastDevice &device)
    {
        VoidResult ready = pImpl_->checkReady();
        if (!ready.isSuccess())
        {
            return ready;
        }
        return pImpl_->lastDevice_->save(device);
    }

    BizResult<LastDevice> LabelLink::loadLastDevice()
    {
        VoidResult ready = pImpl_->checkReady();
        if (!ready.isSuccess())
        {
            return BizResult<LastDevice>(ready);
        }
        return pImpl_->lastDevice_->load();
    }

    VoidResult LabelLink::clearLastDevice()
    {
        VoidResult ready = pImpl_->checkReady();
        if (!ready.isSuccess())
        {
            return ready;
        }
        return pImpl_->lastDevice_->clear();
    }
} // namespace llink
