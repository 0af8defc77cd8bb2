#pragma once

/// @file star_generator.hpp
/// @brief External generator that proposes star names for an emotion.

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace starlight::suggestion
{
    /// @brief One proposal returned by the generator.
    struct GeneratedStar
    {
        std::string name;
        std::string description;
        std::string generated_at;   ///< Opaque timestamp as sent ("generatedAt")
    };

    /// @brief Decoded generator reply.
    struct GeneratorResponse
    {
        bool success = false;
        std::vector<GeneratedStar> stars;
    };

    /// @brief Why the generator stage produced nothing.
    enum class GeneratorError
    {
        Unavailable,   ///< Not configured, threw, failed or returned nothing usable
        Timeout,
    };

    [[nodiscard]] constexpr std::string_view to_string(GeneratorError error)
    {
        switch (error)
        {
            case GeneratorError::Unavailable: return "Unavailable";
            case GeneratorError::Timeout:     return "Timeout";
        }
        return "Unknown";
    }

    /// @brief Generator collaborator.
    ///
    /// Calls may block; SuggestionResolver bounds them with its generator timeout
    /// and abandons overrunning calls, so implementations are held by shared_ptr.
    class StarGenerator
    {
    public:
        virtual ~StarGenerator() = default;

        /// @return The decoded reply, or std::nullopt if the generator could not be reached.
        [[nodiscard]] virtual std::optional<GeneratorResponse> generate(const std::string& emotion_key) = 0;
    };

    /// @brief Decode a generator reply of the form
    /// `{"success": true, "stars": [{"name": ..., "description": ..., "generatedAt": ...}]}`.
    ///
    /// Entries without a string name are skipped.
    /// @return std::nullopt for malformed JSON or a missing/non-boolean "success".
    [[nodiscard]] std::optional<GeneratorResponse> parse_generator_response(std::string_view json);

    /// @brief Replays recorded generator replies stored as `<dir>/<emotion>.json`.
    class JsonFileStarGenerator final : public StarGenerator
    {
    public:
        explicit JsonFileStarGenerator(std::filesystem::path response_dir);

        [[nodiscard]] std::optional<GeneratorResponse> generate(const std::string& emotion_key) override;

        [[nodiscard]] const std::filesystem::path& response_dir() const { return m_response_dir; }

    private:
        std::filesystem::path m_response_dir;
    };

} // namespace starlight::suggestion
