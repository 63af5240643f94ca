#include "connection/connection_manager.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <chrono>
#include <thread>

namespace llink
{
    namespace
    {
        void closeQuietly(const TransportPtr &transport)
        {
            if (!transport)
            {
                return;
            }
            try
            {
                transport->close();
            }
            catch (const std::exception &e)
            {
                LABEL_LOG_WARN("Error closing {} transport: {}", transport->getTransportType(), e.what());
            }
        }

        struct ConnectingFlagReset
        {
            std::atomic<bool> &flag;
            ~ConnectingFlagReset() { flag = false; }
        };
    } // namespace

    ConnectionManager::ConnectionManager(const LabelConnectionConfig &config,
                                         std::shared_ptr<ITransportFactory> transportFactory,
                                         ThreadPool &ioPool,
                                         EventSink sink)
        : config_(config), transportFactory_(std::move(transportFactory)), ioPool_(ioPool), sink_(std::move(sink))
    {
    }

    ConnectionManager::~ConnectionManager()
    {
        TransportPtr transport;
        TransportPtr pending;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            transport = std::move(transport_);
            pending = std::move(pendingTransport_);
            transport_.reset();
            pendingTransport_.reset();
        }
        closeQuietly(pending);
        closeQuietly(transport);
    }

    VoidResult ConnectionManager::validateAddress(const std::string &address)
    {
        if (address.empty())
        {
            return VoidResult::Error(LLINK_ERROR_CODE::INVALID_PARAMETER, "Address must not be empty");
        }
        if (address.size() > MAX_ADDRESS_LENGTH)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::INVALID_PARAMETER,
                                     "Address must not exceed " + std::to_string(MAX_ADDRESS_LENGTH) + " characters");
        }
        if (StringUtils::trim(address) != address)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::INVALID_PARAMETER,
                                     "Address must not have leading or trailing whitespace");
        }
        return VoidResult::Success();
    }

    VoidResult ConnectionManager::connect(const std::string &address, PrinterFamily family)
    {
        VoidResult valid = validateAddress(address);
        if (!valid.isSuccess())
        {
            LABEL_LOG_WARN("Rejected connect: {}", valid.message);
            return valid;
        }

        if (isConnecting_.exchange(true))
        {
            return VoidResult::Error(LLINK_ERROR_CODE::OPERATION_IN_PROGRESS,
                                     "Another connection attempt is already in progress");
        }
        ConnectingFlagReset connectingReset{isConnecting_};

        ConnectionState current = getState();
        if (current.phase != ConnectionPhase::DISCONNECTED && current.address && *current.address == address)
        {
            LABEL_LOG_INFO("Connect requested for the current printer {}, disconnecting",
                           StringUtils::maskString(address));
            return disconnect();
        }

        if (current.phase != ConnectionPhase::DISCONNECTED)
        {
            LABEL_LOG_INFO("Switching printer, disconnecting {} first",
                           StringUtils::maskString(current.address.value_or("")));
            teardown("switching printer");
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.settleDelayMs));
        }

        TransportPtr transport;
        try
        {
            transport = transportFactory_ ? transportFactory_->createTransport(address, family) : nullptr;
        }
        catch (const std::exception &e)
        {
            LABEL_LOG_ERROR("Transport factory failed for {}: {}", StringUtils::maskString(address), e.what());
        }

        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            generation = ++connectGeneration_;
            ConnectionState connecting;
            connecting.address = address;
            connecting.family = family;
            connecting.phase = ConnectionPhase::CONNECTING;
            setStateLocked(connecting);
            pendingTransport_ = transport;
        }

        auto fail = [&](LLINK_ERROR_CODE code, const std::string &message)
        {
            closeQuietly(transport);
            bool cancelled = false;
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                cancelled = generation != connectGeneration_;
                if (!cancelled)
                {
                    pendingTransport_.reset();
                    setStateLocked(disconnectedState());
                }
            }
            if (cancelled)
            {
                LABEL_LOG_INFO("Connection to {} was cancelled", StringUtils::maskString(address));
                return VoidResult::Error(LLINK_ERROR_CODE::OPERATION_CANCELLED, "Connection cancelled");
            }
            LABEL_LOG_WARN("Connection to {} failed: {}", StringUtils::maskString(address), message);
            return VoidResult::Error(code, message);
        };

        if (!transport)
        {
            return fail(LLINK_ERROR_CODE::PRINTER_CONNECTION_ERROR,
                        "No " + std::string(isRadioAddress(address) ? "radio" : "network") +
                            " transport available for " + address);
        }

        LABEL_LOG_INFO("Connecting to {} over {} ({})", StringUtils::maskString(address),
                       transport->getTransportType(), printerFamilyToString(family));

        std::future<VoidResult> attempt;
        try
        {
            attempt = ioPool_.enqueue([transport]()
                                      { return transport->open(); });
        }
        catch (const std::runtime_error &e)
        {
            return fail(LLINK_ERROR_CODE::PRINTER_CONNECTION_ERROR, std::string("Cannot start connection: ") + e.what());
        }

        if (attempt.wait_for(std::chrono::milliseconds(config_.timeoutMs)) != std::future_status::ready)
        {
            return fail(LLINK_ERROR_CODE::OPERATION_TIMEOUT,
                        "Connection timed out after " + TimeUtils::formatDuration(config_.timeoutMs));
        }

        VoidResult opened;
        try
        {
            opened = attempt.get();
        }
        catch (const std::exception &e)
        {
            opened = VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_ERROR, e.what());
        }

        if (!opened.isSuccess())
        {
            return fail(LLINK_ERROR_CODE::PRINTER_CONNECTION_ERROR, "Connection failed: " + opened.message);
        }

        bool cancelled = false;
        {
            std::lock_guard<std::mutex> leaseLock(leaseMutex_);
            std::lock_guard<std::mutex> lock(stateMutex_);
            cancelled = generation != connectGeneration_;
            if (!cancelled)
            {
                pendingTransport_.reset();
                transport_ = transport;
                ConnectionState connected = state_;
                connected.phase = ConnectionPhase::CONNECTED;
                setStateLocked(connected);
            }
        }
        if (cancelled)
        {
            closeQuietly(transport);
            LABEL_LOG_INFO("Connection to {} was cancelled", StringUtils::maskString(address));
            return VoidResult::Error(LLINK_ERROR_CODE::OPERATION_CANCELLED, "Connection cancelled");
        }

        LABEL_LOG_INFO("Connected to {}", StringUtils::maskString(address));
        return VoidResult::Success();
    }

    VoidResult ConnectionManager::disconnect()
    {
        TransportPtr pending;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            ++connectGeneration_;
            pending = std::move(pendingTransport_);
            pendingTransport_.reset();
        }
        if (pending)
        {
            LABEL_LOG_DEBUG("Cancelling pending connection");
            closeQuietly(pending);
        }

        if (!teardown("disconnect requested"))
        {
            LABEL_LOG_DEBUG("disconnect: already disconnected");
        }
        return VoidResult::Success();
    }

    bool ConnectionManager::isConnected()
    {
        TransportPtr transport;
        PrinterFamily family;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (state_.phase != ConnectionPhase::CONNECTED || !transport_)
            {
                return false;
            }
            transport = transport_;
            family = state_.family;
        }

        bool alive = true;
        {
            // A print in progress owns the transport; it reports failures itself
            std::unique_lock<std::mutex> lease(leaseMutex_, std::try_to_lock);
            if (!lease.owns_lock())
            {
                return true;
            }

            try
            {
                if (family == PrinterFamily::SMART_PRINTER)
                {
                    alive = transport->queryStatus().has_value() || transport->isOpen();
                }
                else
                {
                    alive = transport->isOpen();
                }
            }
            catch (const std::exception &e)
            {
                LABEL_LOG_WARN("Connection probe failed: {}", e.what());
                alive = false;
            }
        }

        if (!alive)
        {
            handleTransportFailure(transport, "connection probe failed");
        }
        return alive;
    }

    ConnectionState ConnectionManager::getState() const
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return state_;
    }

    std::optional<TransportLease> ConnectionManager::acquireLease()
    {
        std::unique_lock<std::mutex> lease(leaseMutex_);
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_.phase != ConnectionPhase::CONNECTED || !transport_)
        {
            return std::nullopt;
        }
        return TransportLease{std::move(lease), transport_, state_};
    }

    void ConnectionManager::handleTransportFailure(const TransportPtr &transport, const std::string &reason)
    {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (!transport || transport_ != transport)
            {
                return;
            }
        }
        LABEL_LOG_WARN("Connection lost: {}", reason);
        teardown(reason);
    }

    void ConnectionManager::abortTransport(const TransportPtr &transport, const std::string &reason)
    {
        closeQuietly(transport);
        try
        {
            ioPool_.enqueue([this, transport, reason]()
                            { handleTransportFailure(transport, reason); });
        }
        catch (const std::runtime_error &e)
        {
            LABEL_LOG_WARN("Cannot schedule teardown after abort: {}", e.what());
        }
    }

    bool ConnectionManager::teardown(const std::string &reason)
    {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if ((state_.phase == ConnectionPhase::DISCONNECTED && !transport_) ||
                state_.phase == ConnectionPhase::DISCONNECTING)
            {
                return false;
            }
            ConnectionState disconnecting = state_;
            disconnecting.phase = ConnectionPhase::DISCONNECTING;
            setStateLocked(disconnecting);
        }

        TransportPtr transport;
        {
            std::lock_guard<std::mutex> leaseLock(leaseMutex_);
            std::lock_guard<std::mutex> lock(stateMutex_);
            transport = std::move(transport_);
            transport_.reset();
        }
        closeQuietly(transport);

        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            setStateLocked(disconnectedState());
        }
        LABEL_LOG_INFO("Disconnected ({})", reason);
        return true;
    }

    void ConnectionManager::setStateLocked(const ConnectionState &state)
    {
        state_ = state;
        LABEL_LOG_DEBUG("Connection phase: {}", connectionPhaseToString(state.phase));
        if (sink_ && !sink_(CoreEvent::connectionChanged(state)))
        {
            LABEL_LOG_DEBUG("Connection event dropped, reconciler stopped");
        }
    }

    ConnectionState ConnectionManager::disconnectedState() const
    {
        ConnectionState state;
        state.family = state_.family;
        state.phase = ConnectionPhase::DISCONNECTED;
        return state;
    }
} // namespace llink
