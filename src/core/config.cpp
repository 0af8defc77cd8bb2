/// @file config.cpp
/// @brief JSON configuration parsing.

#include "core/config.hpp"

#include "core/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>

namespace starlight::core
{

namespace
{

// Reads doc[key] into out when present; a present value of the wrong type throws
// nlohmann::json::type_error, which from_json() reports.
template <typename T>
void read_optional(const nlohmann::json& doc, const char* key, T& out)
{
    const auto it = doc.find(key);
    if (it != doc.end() && !it->is_null())
    {
        out = it->get<T>();
    }
}

void read_millis(const nlohmann::json& doc, const char* key, std::chrono::milliseconds& out)
{
    const auto it = doc.find(key);
    if (it != doc.end() && !it->is_null())
    {
        const auto value = it->get<i64>();
        if (value < 0)
        {
            throw std::out_of_range(std::string(key) + " must not be negative");
        }
        out = std::chrono::milliseconds(value);
    }
}

const nlohmann::json& section(const nlohmann::json& doc, const char* key)
{
    static const nlohmann::json kEmpty = nlohmann::json::object();
    const auto it = doc.find(key);
    if (it == doc.end() || it->is_null())
    {
        return kEmpty;
    }
    if (!it->is_object())
    {
        throw std::invalid_argument(std::string("section '") + key + "' must be an object");
    }
    return *it;
}

} // namespace

// -----------------------------------------------------------------
// from_json
// -----------------------------------------------------------------

std::optional<EngineConfig> EngineConfig::from_json(const nlohmann::json& doc)
{
    if (!doc.is_object())
    {
        SLT_CORE_ERROR("EngineConfig: Root element must be a JSON object");
        return std::nullopt;
    }

    EngineConfig config;

    try
    {
        const auto& catalog = section(doc, "catalog");
        read_optional(catalog, "source", config.catalog.source);
        read_optional(catalog, "already_decompressed", config.catalog.already_decompressed);
        read_millis(catalog, "fetch_timeout_ms", config.catalog.fetch_timeout);

        const auto& generator = section(doc, "generator");
        read_optional(generator, "response_dir", config.generator.response_dir);
        read_millis(generator, "timeout_ms", config.generator.timeout);

        const auto& service = section(doc, "service");
        read_millis(service, "background_load_delay_ms", config.service.background_load_delay);
        read_optional(service, "background_load", config.service.background_load);
        read_optional(service, "load_on_demand", config.service.load_on_demand);
        read_optional(service, "default_count", config.service.default_count);
        if (const auto it = service.find("seed"); it != service.end() && !it->is_null())
        {
            config.service.seed = it->get<u64>();
        }

        const auto& logging = section(doc, "logging");
        read_optional(logging, "file", config.logging.file);
        if (const auto it = logging.find("level"); it != logging.end() && !it->is_null())
        {
            const auto name = it->get<std::string>();
            const auto level = spdlog::level::from_str(name);
            // from_str maps unknown names to "off"
            if (level == spdlog::level::off && name != "off")
            {
                throw std::invalid_argument("unknown log level '" + name + "'");
            }
            config.logging.level = level;
        }
    }
    catch (const std::exception& e)
    {
        SLT_CORE_ERROR("EngineConfig: Invalid configuration: {}", e.what());
        return std::nullopt;
    }

    if (config.service.default_count <= 0)
    {
        SLT_CORE_ERROR("EngineConfig: service.default_count must be positive (got {})",
                       config.service.default_count);
        return std::nullopt;
    }

    return config;
}

// -----------------------------------------------------------------
// load_from_file
// -----------------------------------------------------------------

std::optional<EngineConfig> EngineConfig::load_from_file(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SLT_CORE_ERROR("EngineConfig: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    const nlohmann::json doc = nlohmann::json::parse(file, nullptr, /*allow_exceptions=*/false,
                                                     /*ignore_comments=*/true);
    if (doc.is_discarded())
    {
        SLT_CORE_ERROR("EngineConfig: Malformed JSON in: {}", path.string());
        return std::nullopt;
    }

    auto config = from_json(doc);
    if (config)
    {
        SLT_CORE_INFO("EngineConfig: Loaded configuration from {}", path.string());
    }
    return config;
}

} // namespace starlight::core
