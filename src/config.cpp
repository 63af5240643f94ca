#include "config.h"
#include "types/internal/json_serializer.h"
#include "utils/logger.h"
#include <fstream>
#include <sstream>

namespace llink
{
    BizResult<LabelLinkConfig> parseConfig(const std::string &json)
    {
        try
        {
            auto document = nlohmann::json::parse(json);
            if (!document.is_object())
            {
                return BizResult<LabelLinkConfig>::Error(LLINK_ERROR_CODE::INVALID_PARAMETER,
                                                         "Configuration must be a JSON object");
            }
            return BizResult<LabelLinkConfig>::Ok(document.get<LabelLinkConfig>());
        }
        catch (const nlohmann::json::exception &e)
        {
            return BizResult<LabelLinkConfig>::Error(LLINK_ERROR_CODE::INVALID_PARAMETER,
                                                     std::string("Invalid configuration: ") + e.what());
        }
    }

    BizResult<LabelLinkConfig> loadConfigFromFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            LABEL_LOG_ERROR("Cannot open configuration file: {}", path);
            return BizResult<LabelLinkConfig>::Error(LLINK_ERROR_CODE::INVALID_PARAMETER,
                                                     "Cannot open configuration file: " + path);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        auto result = parseConfig(buffer.str());
        if (!result.isSuccess())
        {
            LABEL_LOG_ERROR("Failed to load configuration from {}: {}", path, result.message);
        }
        return result;
    }

    std::string configToJson(const LabelLinkConfig &config)
    {
        nlohmann::json document = config;
        return document.dump(4);
    }
} // namespace llink
