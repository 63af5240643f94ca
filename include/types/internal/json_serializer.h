#pragma once
#include "../../config.h"
#include "../../platform/last_device_store.h"
#include "../device.h"
#include "../discovery.h"
#include "../print_job.h"
#include <chrono>
#include <nlohmann/json.hpp>

#ifdef NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT
#undef NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT
#endif

// Missing keys keep the member's default value
#define NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Type, ...)                                                                                                \
    template <typename BasicJsonType, nlohmann::detail::enable_if_t<nlohmann::detail::is_basic_json<BasicJsonType>::value, int> = 0>                              \
    static void to_json(BasicJsonType &nlohmann_json_j, const Type &nlohmann_json_t) { NLOHMANN_JSON_EXPAND(NLOHMANN_JSON_PASTE(NLOHMANN_JSON_TO, __VA_ARGS__)) } \
    template <typename BasicJsonType, nlohmann::detail::enable_if_t<nlohmann::detail::is_basic_json<BasicJsonType>::value, int> = 0>                              \
    static void from_json(const BasicJsonType &nlohmann_json_j, Type &nlohmann_json_t)                                                                            \
    {                                                                                                                                                             \
        const Type nlohmann_json_default_obj{};                                                                                                                   \
        NLOHMANN_JSON_EXPAND(NLOHMANN_JSON_PASTE(NLOHMANN_JSON_FROM_WITH_DEFAULT, __VA_ARGS__))                                                                   \
    }

namespace llink
{
#if 1 // Enums
    NLOHMANN_JSON_SERIALIZE_ENUM(PrinterFamily, {
                                                    {PrinterFamily::SMART_PRINTER, "smart"},
                                                    {PrinterFamily::GENERIC_SOCKET_PRINTER, "generic"},
                                                })

    NLOHMANN_JSON_SERIALIZE_ENUM(StatusSeverity, {
                                                     {StatusSeverity::DISCONNECTED, "disconnected"},
                                                     {StatusSeverity::CONNECTING, "connecting"},
                                                     {StatusSeverity::CONNECTED, "connected"},
                                                 })

    NLOHMANN_JSON_SERIALIZE_ENUM(ConnectionPhase, {
                                                      {ConnectionPhase::DISCONNECTED, "disconnected"},
                                                      {ConnectionPhase::CONNECTING, "connecting"},
                                                      {ConnectionPhase::CONNECTED, "connected"},
                                                      {ConnectionPhase::DISCONNECTING, "disconnecting"},
                                                  })

    NLOHMANN_JSON_SERIALIZE_ENUM(MediaType, {
                                                {MediaType::LABEL, "label"},
                                                {MediaType::BLACK_MARK, "blackMark"},
                                                {MediaType::JOURNAL, "journal"},
                                            })

    NLOHMANN_JSON_SERIALIZE_ENUM(DiscoveryStatus, {
                                                      {DiscoveryStatus::IDLE, "idle"},
                                                      {DiscoveryStatus::SCANNING, "scanning"},
                                                      {DiscoveryStatus::COMPLETED, "completed"},
                                                      {DiscoveryStatus::ERROR_STATE, "error"},
                                                  })

    NLOHMANN_JSON_SERIALIZE_ENUM(PrintJobStatus, {
                                                     {PrintJobStatus::QUEUED, "queued"},
                                                     {PrintJobStatus::PRINTING, "printing"},
                                                     {PrintJobStatus::COMPLETED, "completed"},
                                                     {PrintJobStatus::FAILED, "failed"},
                                                     {PrintJobStatus::CANCELLED, "cancelled"},
                                                 })

    // Numeric on the wire, matching the platform error codes
    inline void to_json(nlohmann::json &j, const DiscoveryErrorKind &kind)
    {
        j = static_cast<int>(kind);
    }
    inline void from_json(const nlohmann::json &j, DiscoveryErrorKind &kind)
    {
        kind = static_cast<DiscoveryErrorKind>(j.get<int>());
    }

    inline void to_json(nlohmann::json &j, const LLINK_ERROR_CODE &code)
    {
        j = static_cast<int>(code);
    }
    inline void from_json(const nlohmann::json &j, LLINK_ERROR_CODE &code)
    {
        code = static_cast<LLINK_ERROR_CODE>(j.get<int>());
    }
#endif

#if 1 // Configuration
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LabelLogConfig,
                                                    logLevel, logEnableConsole, logEnableFile, logFileName,
                                                    logMaxFileSize, logMaxFiles)

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LabelDiscoveryConfig,
                                                    timeoutMs, networkProbePeriodMs, networkProbePort, receiveWindowMs)

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LabelConnectionConfig,
                                                    timeoutMs, settleDelayMs, smartPrinterPort, genericPrinterPort,
                                                    socketIoTimeoutMs)

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LabelPrintConfig,
                                                    timeoutMs, smartSettleMs, radioExtraSettleMs, genericSettleMs,
                                                    statusQueryTimeoutMs)

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LabelLinkConfig,
                                                    log, discovery, connection, print, enableDebugLogging,
                                                    autoConnectLastPrinter)
#endif

#if 1 // Devices
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Device,
                                                    address, displayName, isWifi, statusText, statusSeverity,
                                                    isConnected)

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LastDevice,
                                                    address, displayName, isWifi, family)

    inline void to_json(nlohmann::json &j, const ConnectionState &state)
    {
        j["address"] = state.address ? nlohmann::json(*state.address) : nlohmann::json(nullptr);
        j["family"] = state.family;
        j["phase"] = state.phase;
    }
#endif

#if 1 // Sessions and jobs, timestamps as epoch milliseconds
    inline long long toEpochMs(const std::chrono::system_clock::time_point &timePoint)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch()).count();
    }

    inline void to_json(nlohmann::json &j, const DiscoverySession &session)
    {
        j["id"] = session.id;
        j["status"] = session.status;
        j["devices"] = session.devices;
        j["startedAt"] = toEpochMs(session.startedAt);
        j["completedAt"] = session.completedAt ? nlohmann::json(toEpochMs(*session.completedAt)) : nlohmann::json(nullptr);
        j["errorMessage"] = session.errorMessage ? nlohmann::json(*session.errorMessage) : nlohmann::json(nullptr);
        j["errorKind"] = session.errorKind;
    }

    inline void to_json(nlohmann::json &j, const PrintJob &job)
    {
        j["id"] = job.id;
        j["payloadSize"] = job.payload.size();
        j["status"] = job.status;
        j["createdAt"] = toEpochMs(job.createdAt);
        j["completedAt"] = job.completedAt ? nlohmann::json(toEpochMs(*job.completedAt)) : nlohmann::json(nullptr);
        j["errorMessage"] = job.errorMessage ? nlohmann::json(*job.errorMessage) : nlohmann::json(nullptr);
        j["errorCode"] = job.errorCode;
    }
#endif
} // namespace llink
