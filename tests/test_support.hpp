#pragma once

/// @file test_support.hpp
/// @brief Shared fixtures for the Starlight test executables.

#include "catalog/catalog_fetcher.hpp"
#include "catalog/catalog_index.hpp"
#include "catalog/catalog_parser.hpp"
#include "suggestion/star_generator.hpp"

#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace starlight::test
{
    /// @brief File in the temp directory, removed on destruction.
    class TempFile
    {
    public:
        TempFile(const std::string& filename, const std::string& content)
            : m_path(std::filesystem::temp_directory_path() / filename)
        {
            std::ofstream file(m_path, std::ios::binary);
            file << content;
        }

        ~TempFile()
        {
            std::error_code ec;
            std::filesystem::remove(m_path, ec);
        }

        TempFile(const TempFile&) = delete;
        TempFile& operator=(const TempFile&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

    /// @brief Private directory under the temp directory, removed recursively on destruction.
    class TempDir
    {
    public:
        explicit TempDir(const std::string& prefix)
            : m_path(std::filesystem::temp_directory_path() /
                     fmt::format("{}-{}", prefix, std::chrono::steady_clock::now().time_since_epoch().count()))
        {
            std::filesystem::create_directories(m_path);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        /// @brief Write @p content to @p filename inside the directory.
        void write(const std::string& filename, const std::string& content) const
        {
            std::ofstream file(m_path / filename, std::ios::binary);
            file << content;
        }

        [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    private:
        std::filesystem::path m_path;
    };

    /// @brief Thrown by the doubles below; deliberately not a std::exception.
    struct ForeignFailure
    {
        int code = 42;
    };

    /// @brief Small HYG-style catalog: three named stars of the Summer Triangle and one unnamed star.
    inline constexpr const char* kSummerTriangleCsv =
        "id,proper,ra,dec,dist,mag,absmag,spect,var,x,y,z,con,bayer\n"
        "91262,Vega,18.615649,38.783692,7.68,0.03,0.604,A0V,,1.9,-7.0,4.8,Lyr,Alp\n"
        "97649,Altair,19.846388,8.868321,5.13,0.76,2.21,A7V,,2.5,-4.5,0.8,Aql,Alp\n"
        "102098,Deneb,20.690532,45.280338,432.9,1.25,-6.93,A2Ia,Alp Cyg,124.6,-261.3,307.6,Cyg,Alp\n"
        "1,,0.000060,1.089009,219.78,9.10,2.39,F5,,219.7,0.003,4.2,Psc,\n";

    /// @brief CSV with @p named_count named stars (magnitudes 1.0, 1.1, ...) and a few unnamed ones.
    inline std::string make_named_catalog_csv(int named_count)
    {
        std::string csv = "id,proper,ra,dec,dist,mag,absmag,spect,var,x,y,z\n";
        for (int i = 0; i < named_count; ++i)
        {
            csv += fmt::format("{},Star{:03d},{:.3f},{:.3f},{:.1f},{:.2f},1.0,G2V,,1,1,1\n",
                               1000 + i, i, 0.1 * i, -45.0 + i, 20.0 + i, 1.0 + 0.1 * i);
        }
        for (int i = 0; i < 3; ++i)
        {
            csv += fmt::format("{},,1.0,1.0,50.0,{:.2f},1.0,K0,,1,1,1\n", 5000 + i, 8.0 + i);
        }
        return csv;
    }

    /// @brief Parse CSV text straight into a shared index.
    inline std::shared_ptr<const catalog::CatalogIndex> make_index(const std::string& csv)
    {
        auto report = catalog::CatalogParser::parse_csv(csv);
        return std::make_shared<const catalog::CatalogIndex>(std::move(report.records));
    }

    // -----------------------------------------------------------------
    // Fetcher doubles
    // -----------------------------------------------------------------

    /// @brief Returns a fixed payload (or failure) after an optional delay, counting calls.
    class ScriptedFetcher final : public catalog::CatalogFetcher
    {
    public:
        explicit ScriptedFetcher(std::optional<std::string> payload,
                                 std::chrono::milliseconds delay = std::chrono::milliseconds(0))
            : m_payload(std::move(payload))
            , m_delay(delay)
        {
        }

        std::optional<std::string> fetch(const std::string& /*locator*/) override
        {
            ++m_calls;
            if (m_delay.count() > 0)
            {
                std::this_thread::sleep_for(m_delay);
            }
            return m_payload;
        }

        [[nodiscard]] int calls() const { return m_calls.load(); }

    private:
        std::optional<std::string> m_payload;
        std::chrono::milliseconds m_delay;
        std::atomic<int> m_calls{0};
    };

    /// @brief Always throws from fetch().
    class ThrowingFetcher final : public catalog::CatalogFetcher
    {
    public:
        std::optional<std::string> fetch(const std::string& locator) override
        {
            throw std::runtime_error("connection refused: " + locator);
        }
    };

    /// @brief Throws a non-std exception from fetch().
    class ForeignThrowingFetcher final : public catalog::CatalogFetcher
    {
    public:
        std::optional<std::string> fetch(const std::string& /*locator*/) override
        {
            ++m_calls;
            throw ForeignFailure{};
        }

        [[nodiscard]] int calls() const { return m_calls.load(); }

    private:
        std::atomic<int> m_calls{0};
    };

    // -----------------------------------------------------------------
    // Generator doubles
    // -----------------------------------------------------------------

    /// @brief Returns a fixed reply after an optional delay, counting calls.
    class ScriptedGenerator final : public suggestion::StarGenerator
    {
    public:
        explicit ScriptedGenerator(std::optional<suggestion::GeneratorResponse> reply,
                                   std::chrono::milliseconds delay = std::chrono::milliseconds(0))
            : m_reply(std::move(reply))
            , m_delay(delay)
        {
        }

        std::optional<suggestion::GeneratorResponse> generate(const std::string& /*emotion_key*/) override
        {
            ++m_calls;
            if (m_delay.count() > 0)
            {
                std::this_thread::sleep_for(m_delay);
            }
            return m_reply;
        }

        [[nodiscard]] int calls() const { return m_calls.load(); }

    private:
        std::optional<suggestion::GeneratorResponse> m_reply;
        std::chrono::milliseconds m_delay;
        std::atomic<int> m_calls{0};
    };

    /// @brief Always throws from generate().
    class ThrowingGenerator final : public suggestion::StarGenerator
    {
    public:
        std::optional<suggestion::GeneratorResponse> generate(const std::string& /*emotion_key*/) override
        {
            throw std::runtime_error("generator offline");
        }
    };

    /// @brief Throws a non-std exception from generate().
    class ForeignThrowingGenerator final : public suggestion::StarGenerator
    {
    public:
        std::optional<suggestion::GeneratorResponse> generate(const std::string& /*emotion_key*/) override
        {
            throw ForeignFailure{};
        }
    };

    /// @brief Successful reply proposing the given names.
    inline suggestion::GeneratorResponse proposals(std::initializer_list<const char*> names)
    {
        suggestion::GeneratorResponse response;
        response.success = true;
        for (const char* name : names)
        {
            response.stars.push_back(suggestion::GeneratedStar{
                .name = name,
                .description = std::string("Proposed: ") + name,
                .generated_at = "2024-01-01T00:00:00Z",
            });
        }
        return response;
    }

} // namespace starlight::test
