#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <print>
#include <ranges>

#include "Application.hpp"
#include "simulations/Export.hpp"
#include "Util.hpp"

[[nodiscard]] static auto read_tables(const std::span<const std::filesystem::path> paths)
  -> std::optional<std::vector<Simulations::MetEntries>>
{
    std::vector<Simulations::MetEntries> tables;
    tables.reserve(paths.size());
    for (const auto& path : paths) {
        const auto content = TRY(Util::read_entire_file(path));
        const auto entries = Simulations::parse_met(content);
        if (!entries) {
            std::println(stderr, "[ERROR] (comparator) could not parse {}", path.string());
            return std::nullopt;
        }
        tables.push_back(*entries);
    }

    return tables;
}

// Numeric keys of the first table, in file order, with one value per table.
[[nodiscard]] static auto group_tables_by_keys(
  const std::span<const Simulations::MetEntries> tables,
  const std::span<const std::filesystem::path>   paths
) -> std::optional<std::vector<Application::MetricSeries>>
{
    std::vector<Application::MetricSeries> result;

    for (const auto& [key, first_value] : tables.front()) {
        if (!Util::parse_double(first_value)) { continue; }

        std::vector<double> values;
        for (const auto& [table, path] : std::views::zip(tables, paths)) {
            const auto entry = std::ranges::find(table, key, &Simulations::MetEntries::value_type::first);
            if (entry == table.end()) {
                std::println(stderr, "[ERROR] (comparator) {} has no `{}` entry", path.string(), key);
                return std::nullopt;
            }

            const auto value = Util::parse_double(entry->second);
            if (!value) {
                std::println(
                  stderr, "[ERROR] (comparator) {}: `{}` is not a number: {}", path.string(), key, entry->second
                );
                return std::nullopt;
            }
            values.push_back(*value);
        }

        result.emplace_back(Util::capitalize(Util::wordify(key)), std::move(values));
    }

    if (result.empty()) {
        std::println(stderr, "[ERROR] (comparator) no numeric entries to compare");
        return std::nullopt;
    }

    return result;
}

static void usage(const char* executable) { std::println("{}: (<file1.met> <file2.met>)+", executable); }

auto main(int argc, const char** argv) -> int
{
    const std::span args(argv, static_cast<std::size_t>(argc));
    if (args.size() < 3) {
        usage(args[0]);
        return 1;
    }

    std::vector<std::filesystem::path> file_paths;
    for (const auto& arg : args | std::views::drop(1)) { file_paths.emplace_back(arg); }

    std::vector<std::string> file_stems;
    for (const auto& file_path : file_paths) { file_stems.push_back(file_path.stem().string()); }

    const auto tables = read_tables(file_paths);
    if (!tables) { return 1; }

    auto series = group_tables_by_keys(*tables, file_paths);
    if (!series) { return 1; }

    const auto app = Application::create(std::move(file_stems), *std::move(series));
    if (!app) { return 1; }
    app->render();
}
