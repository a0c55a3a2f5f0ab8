#include "PipelineFactory.hpp"

#include "corpus/filters/AugumentForZhFilter.hpp"
#include "corpus/filters/BasicFilters.hpp"
#include "corpus/filters/LangFilter.hpp"
#include "corpus/filters/LengthFilters.hpp"
#include "corpus/filters/OverlapFilter.hpp"
#include "corpus/filters/ScriptRatioFilters.hpp"
#include "corpus/normalizers/Hant2Hans.hpp"
#include "corpus/normalizers/NoPrintNormalizer.hpp"
#include "corpus/normalizers/PairPunctNormalizer.hpp"
#include "corpus/normalizers/SpaceNormalizer.hpp"
#include "text/TextUtils.hpp"

#include <algorithm>
#include <initializer_list>
#include <string_view>
#include <utility>

#include <plog/Log.h>

namespace config
{

namespace
{

// Typed access to one [[pipeline.*]] entry with errors that name the entry
class StageReader
{
public:
    StageReader(const toml::table& table, std::string where)
        : table_(table)
        , where_(std::move(where))
    {
    }

    [[nodiscard]] std::string type() const { return requireString("type"); }

    void expectOnly(std::initializer_list<std::string_view> keys) const
    {
        for (const auto& [key, value] : table_)
        {
            if (key.str() == "type")
                continue;
            if (std::find(keys.begin(), keys.end(), key.str()) == keys.end())
                fail("unknown key '" + std::string(key.str()) + "'");
        }
    }

    [[nodiscard]] bool getBool(std::string_view key, bool fallback) const
    {
        auto node = table_[key];
        if (!node)
            return fallback;
        if (auto v = node.value_exact<bool>())
            return *v;
        fail("'" + std::string(key) + "' must be a boolean");
    }

    [[nodiscard]] std::optional<double> optDouble(std::string_view key) const
    {
        auto node = table_[key];
        if (!node)
            return std::nullopt;
        if (!node.is_number())
            fail("'" + std::string(key) + "' must be a number");
        return node.value<double>();
    }

    [[nodiscard]] double getDouble(std::string_view key, double fallback) const
    {
        return optDouble(key).value_or(fallback);
    }

    [[nodiscard]] double requireDouble(std::string_view key) const
    {
        auto v = optDouble(key);
        if (!v)
            fail("'" + std::string(key) + "' is required");
        return *v;
    }

    [[nodiscard]] std::optional<std::size_t> optSize(std::string_view key) const
    {
        auto node = table_[key];
        if (!node)
            return std::nullopt;
        auto v = node.value_exact<int64_t>();
        if (!v || *v < 0)
            fail("'" + std::string(key) + "' must be a non-negative integer");
        return static_cast<std::size_t>(*v);
    }

    [[nodiscard]] std::optional<std::string> optString(std::string_view key) const
    {
        auto node = table_[key];
        if (!node)
            return std::nullopt;
        if (auto v = node.value_exact<std::string>())
            return *v;
        fail("'" + std::string(key) + "' must be a string");
    }

    [[nodiscard]] std::string requireString(std::string_view key) const
    {
        auto v = optString(key);
        if (!v)
            fail("'" + std::string(key) + "' is required");
        return *v;
    }

    [[nodiscard]] std::vector<std::string> stringArray(std::string_view key) const
    {
        std::vector<std::string> out;
        const toml::array* arr = table_[key].as_array();
        if (!arr)
        {
            if (table_[key])
                fail("'" + std::string(key) + "' must be an array of strings");
            return out;
        }
        for (const auto& element : *arr)
        {
            auto v = element.value_exact<std::string>();
            if (!v)
                fail("'" + std::string(key) + "' must be an array of strings");
            out.push_back(*v);
        }
        return out;
    }

    [[nodiscard]] std::vector<double> numberArray(std::string_view key) const
    {
        std::vector<double> out;
        const toml::array* arr = table_[key].as_array();
        if (!arr)
        {
            if (table_[key])
                fail("'" + std::string(key) + "' must be an array of numbers");
            return out;
        }
        for (const auto& element : *arr)
        {
            if (!element.is_number())
                fail("'" + std::string(key) + "' must be an array of numbers");
            out.push_back(element.value<double>().value_or(0.0));
        }
        return out;
    }

    [[nodiscard]] corpus::LengthFunction lengthFunction(std::string_view key) const
    {
        const std::string name = optString(key).value_or("char");
        if (name == "char")
            return &text::charLength;
        if (name == "space")
            return &text::spaceSeparatedLength;
        fail("'" + std::string(key) + "' must be \"char\" or \"space\", got \"" + name + "\"");
    }

    [[nodiscard]] corpus::LengthBounds bounds(std::string_view min_key, std::string_view max_key) const
    {
        return corpus::LengthBounds{ optSize(min_key), optSize(max_key) };
    }

    [[noreturn]] void fail(const std::string& message) const { throw ConfigError(where_ + ": " + message); }

    const toml::table& table() const { return table_; }
    const std::string& where() const { return where_; }

private:
    const toml::table& table_;
    std::string where_;
};

std::optional<std::size_t> wordLimit(const StageReader& reader, std::string_view key)
{
    // 0 disables the check for that side
    auto limit = reader.optSize(key);
    if (!limit)
        return 40;
    if (*limit == 0)
        return std::nullopt;
    return limit;
}

std::vector<corpus::PunctPair> punctPairs(const StageReader& reader)
{
    const toml::array* arr = reader.table()["pairs"].as_array();
    if (!arr)
    {
        if (reader.table()["pairs"])
            reader.fail("'pairs' must be an array of [open, close] string pairs");
        return corpus::defaultPunctPairs();
    }

    std::vector<corpus::PunctPair> pairs;
    for (const auto& element : *arr)
    {
        const toml::array* entry = element.as_array();
        if (!entry || entry->size() != 2)
            reader.fail("'pairs' must be an array of [open, close] string pairs");
        auto open = (*entry)[0].value_exact<std::string>();
        auto close = (*entry)[1].value_exact<std::string>();
        if (!open || !close)
            reader.fail("'pairs' must be an array of [open, close] string pairs");
        pairs.emplace_back(*open, *close);
    }
    return pairs;
}

template<typename Fn>
auto constructStage(const StageReader& reader, Fn&& fn)
{
    try
    {
        return fn();
    }
    catch (const std::invalid_argument& ex)
    {
        reader.fail(ex.what());
    }
    catch (const std::runtime_error& ex)
    {
        if (dynamic_cast<const ConfigError*>(&ex))
            throw;
        reader.fail(ex.what());
    }
}

} // namespace

PipelineFactory::PipelineFactory(std::shared_ptr<const text::ILanguageDetector> detector)
    : detector_(std::move(detector))
{
    if (!detector_)
        detector_ = std::make_shared<text::ScriptLanguageDetector>();
}

std::unique_ptr<corpus::IFilter> PipelineFactory::createFilter(const toml::table& stage) const
{
    StageReader reader(stage, "filter");
    const std::string type = reader.type();
    StageReader r(stage, "filter '" + type + "'");

    return constructStage(r,
                          [&]() -> std::unique_ptr<corpus::IFilter>
                          {
                              if (type == "same")
                              {
                                  r.expectOnly({ "lower" });
                                  return std::make_unique<corpus::SameFilter>(r.getBool("lower", true));
                              }
                              if (type == "has_zh")
                              {
                                  r.expectOnly({ "filter_src" });
                                  return std::make_unique<corpus::HasZhFilter>(r.getBool("filter_src", true));
                              }
                              if (type == "overlap")
                              {
                                  r.expectOnly({ "ratio" });
                                  return std::make_unique<corpus::OverlapFilter>(r.getDouble("ratio", 0.8));
                              }
                              if (type == "empty")
                              {
                                  r.expectOnly({});
                                  return std::make_unique<corpus::EmptyFilter>();
                              }
                              if (type == "all_ascii")
                              {
                                  r.expectOnly({});
                                  return std::make_unique<corpus::AllASCII>();
                              }
                              if (type == "ascii_ratio")
                              {
                                  r.expectOnly({ "threshold", "filter_src", "filter_tgt" });
                                  return std::make_unique<corpus::ASCIIRatioFilter>(r.getDouble("threshold", 0.67),
                                                                                    r.getBool("filter_src", false),
                                                                                    r.getBool("filter_tgt", true));
                              }
                              if (type == "lang")
                              {
                                  r.expectOnly({ "src_lang", "tgt_lang" });
                                  return std::make_unique<corpus::LangFilter>(r.requireString("src_lang"),
                                                                              r.requireString("tgt_lang"), detector_);
                              }
                              if (type == "len")
                              {
                                  r.expectOnly({ "src_min", "src_max", "tgt_min", "tgt_max", "src_len_fn",
                                                 "tgt_len_fn" });
                                  return std::make_unique<corpus::LenFilter>(
                                      r.bounds("src_min", "src_max"), r.bounds("tgt_min", "tgt_max"),
                                      r.lengthFunction("src_len_fn"), r.lengthFunction("tgt_len_fn"));
                              }
                              if (type == "length")
                              {
                                  r.expectOnly({ "src_min", "src_max", "tgt_min", "tgt_max", "src_len_fn",
                                                 "tgt_len_fn", "ratio" });
                                  return std::make_unique<corpus::LengthFilter>(
                                      r.lengthFunction("src_len_fn"), r.lengthFunction("tgt_len_fn"),
                                      r.bounds("src_min", "src_max"), r.bounds("tgt_min", "tgt_max"),
                                      r.getDouble("ratio", 3.0));
                              }
                              if (type == "len_diff")
                              {
                                  r.expectOnly({ "ratio", "src_len_fn", "tgt_len_fn" });
                                  return std::make_unique<corpus::LenDiffFilter>(r.requireDouble("ratio"),
                                                                                 r.lengthFunction("src_len_fn"),
                                                                                 r.lengthFunction("tgt_len_fn"));
                              }
                              if (type == "long_word")
                              {
                                  r.expectOnly({ "src_max", "tgt_max" });
                                  return std::make_unique<corpus::LongWordFilter>(wordLimit(r, "src_max"),
                                                                                  wordLimit(r, "tgt_max"));
                              }
                              if (type == "alphabet_ratio")
                              {
                                  r.expectOnly({ "threshold", "exclude_whitespace" });
                                  return std::make_unique<corpus::AlphabetRatioFilter>(
                                      r.getDouble("threshold", 0.75), r.getBool("exclude_whitespace", false));
                              }
                              if (type == "character_ratio")
                              {
                                  r.expectOnly({ "scripts", "thresholds" });
                                  return std::make_unique<corpus::CharacterRatioFilter>(r.stringArray("scripts"),
                                                                                        r.numberArray("thresholds"));
                              }
                              if (type == "augument_for_zh")
                              {
                                  r.expectOnly({});
                                  return std::make_unique<corpus::AugumentForZhFilter>();
                              }
                              r.fail("unknown filter type");
                          });
}

std::unique_ptr<corpus::INormalizer> PipelineFactory::createNormalizer(const toml::table& stage) const
{
    StageReader reader(stage, "normalizer");
    const std::string type = reader.type();
    StageReader r(stage, "normalizer '" + type + "'");

    return constructStage(r,
                          [&]() -> std::unique_ptr<corpus::INormalizer>
                          {
                              if (type == "space")
                              {
                                  r.expectOnly({});
                                  return std::make_unique<corpus::SpaceNormalizer>();
                              }
                              if (type == "no_print")
                              {
                                  r.expectOnly({});
                                  return std::make_unique<corpus::NoPrintNormalizer>();
                              }
                              if (type == "pair_punct")
                              {
                                  r.expectOnly({ "pairs" });
                                  return std::make_unique<corpus::PairPunctNormalizer>(punctPairs(r));
                              }
                              if (type == "hant2hans")
                              {
                                  r.expectOnly({ "norm_src", "norm_tgt" });
                                  return std::make_unique<corpus::Hant2Hans>(r.getBool("norm_src", true),
                                                                             r.getBool("norm_tgt", true));
                              }
                              r.fail("unknown normalizer type");
                          });
}

corpus::Pipeline PipelineFactory::build(const toml::table& pipeline_section) const
{
    corpus::Pipeline pipeline;

    auto stages = [&](std::string_view key) -> const toml::array*
    {
        auto node = pipeline_section[key];
        if (!node)
            return nullptr;
        const toml::array* arr = node.as_array();
        // toml++ does not count an empty array as an array of tables
        if (!arr || (!arr->empty() && !arr->is_array_of_tables()))
            throw ConfigError("pipeline." + std::string(key) + " must be an array of tables");
        return arr;
    };

    if (const toml::array* normalizers = stages("normalizers"))
    {
        for (const auto& node : *normalizers)
            pipeline.addNormalizer(createNormalizer(*node.as_table()));
    }

    if (const toml::array* filters = stages("filters"))
    {
        for (const auto& node : *filters)
            pipeline.addFilter(createFilter(*node.as_table()));
    }

    if (pipeline.empty())
        PLOG_WARNING << "Pipeline has no stages, every pair will be kept unchanged";

    return pipeline;
}

} // namespace config
