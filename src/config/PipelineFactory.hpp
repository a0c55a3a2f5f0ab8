#pragma once

#include "corpus/Pipeline.hpp"
#include "text/LanguageDetector.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include <toml++/toml.h>

namespace config
{

// Invalid pipeline description; raised before any corpus line is read
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Builds a corpus::Pipeline from the [pipeline] table.
 *
 * [[pipeline.normalizers]] and [[pipeline.filters]] are arrays of tables with
 * a `type` key plus that stage's parameters. Order in the file is the order of
 * application.
 *
 * @throws ConfigError for unknown types or keys, wrongly typed values and
 * parameters the stage constructors reject
 */
class PipelineFactory
{
public:
    explicit PipelineFactory(std::shared_ptr<const text::ILanguageDetector> detector = nullptr);

    [[nodiscard]] corpus::Pipeline build(const toml::table& pipeline_section) const;

    [[nodiscard]] std::unique_ptr<corpus::IFilter> createFilter(const toml::table& stage) const;
    [[nodiscard]] std::unique_ptr<corpus::INormalizer> createNormalizer(const toml::table& stage) const;

private:
    std::shared_ptr<const text::ILanguageDetector> detector_;
};

} // namespace config
