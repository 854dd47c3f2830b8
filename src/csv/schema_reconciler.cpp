// EN: Schema reconciliation implementation
// FR: Implémentation de la réconciliation de schéma

#include "csv/schema_reconciler.hpp"
#include "csv/combine_errors.hpp"
#include "infrastructure/logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_set>

namespace ConCat {
namespace CSV {

namespace {

std::vector<std::string> uniqueInOrder(const std::vector<std::string>& names) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& name : names) {
        if (seen.insert(name).second) {
            out.push_back(name);
        }
    }
    return out;
}

std::string lowered(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::string schemaModeToString(SchemaMode mode) {
    return mode == SchemaMode::REQUESTED ? "requested" : "reconciled";
}

size_t ColumnMapping::missingCount() const {
    return static_cast<size_t>(std::count(source_index.begin(), source_index.end(), std::nullopt));
}

std::vector<std::string> SchemaReconciler::reconcile(const std::vector<std::vector<std::string>>& headers,
                                                     SchemaPolicy policy,
                                                     const std::vector<std::string>& file_names) {
    if (headers.empty()) {
        return {};
    }
    auto nameOf = [&](size_t i) {
        return i < file_names.size() ? file_names[i] : "#" + std::to_string(i + 1);
    };

    switch (policy) {
        case SchemaPolicy::STRICT: {
            const auto& base = headers.front();
            std::set<std::string> base_set(base.begin(), base.end());
            for (size_t i = 1; i < headers.size(); ++i) {
                std::set<std::string> other(headers[i].begin(), headers[i].end());
                if (other != base_set) {
                    throw SchemaMismatchError(
                        "Schema mismatch under --schema strict in " + nameOf(i) + ".\n"
                        "Base: " + formatNameList(base) + "\nOther: " + formatNameList(headers[i]),
                        nameOf(i), base, headers[i]);
                }
            }
            return uniqueInOrder(base);
        }

        case SchemaPolicy::UNION: {
            std::vector<std::string> all;
            for (const auto& header : headers) {
                all.insert(all.end(), header.begin(), header.end());
            }
            return uniqueInOrder(all);
        }

        case SchemaPolicy::INTERSECTION: {
            std::vector<std::string> shared;
            for (const auto& column : uniqueInOrder(headers.front())) {
                bool everywhere = std::all_of(headers.begin() + 1, headers.end(), [&](const auto& header) {
                    return std::find(header.begin(), header.end(), column) != header.end();
                });
                if (everywhere) {
                    shared.push_back(column);
                }
            }
            if (shared.empty()) {
                throw EmptyIntersectionError("No shared columns under --schema intersection.");
            }
            return shared;
        }
    }
    throw ConfigurationError("Unknown schema policy");
}

SchemaPlan SchemaReconciler::planReconciled(const std::vector<SourceFile>& files, SchemaPolicy policy) {
    std::vector<std::vector<std::string>> headers;
    std::vector<std::string> names;
    headers.reserve(files.size());
    for (const auto& file : files) {
        headers.push_back(file.header());
        names.push_back(file.origin().string());
    }

    SchemaPlan plan;
    plan.mode = SchemaMode::RECONCILED;
    plan.policy = policy;
    plan.columns = reconcile(headers, policy, names);
    plan.files = files;
    for (const auto& file : files) {
        plan.mappings.push_back(mapColumns(file, plan.columns, false));
    }

    LOG_INFO("schema", "policy=" + schemaPolicyToString(policy) + " -> " +
             std::to_string(plan.columns.size()) + " columns");
    LOG_DEBUG("schema", "columns=" + formatNameList(plan.columns));
    return plan;
}

SchemaPlan SchemaReconciler::planRequested(const std::vector<SourceFile>& files,
                                           const std::vector<std::string>& requested,
                                           bool case_insensitive,
                                           MissingPolicy missing_policy) {
    if (requested.empty()) {
        throw ConfigurationError("--columns requires at least one column name");
    }
    std::unordered_set<std::string> seen;
    for (const auto& name : requested) {
        if (!seen.insert(case_insensitive ? lowered(name) : name).second) {
            throw ConfigurationError("Duplicate column in --columns: '" + name + "'");
        }
    }

    SchemaPlan plan;
    plan.mode = SchemaMode::REQUESTED;
    plan.columns = requested;
    plan.case_insensitive = case_insensitive;
    plan.missing_policy = missing_policy;

    for (const auto& file : files) {
        std::vector<std::string> missing;
        ColumnMapping mapping = mapColumns(file, requested, case_insensitive, &missing);
        if (!missing.empty()) {
            switch (missing_policy) {
                case MissingPolicy::ERROR:
                    throw MissingColumnsError("File '" + file.origin().string() + "': missing requested columns " +
                                              formatNameList(missing) + " under --missing-policy error",
                                              file.origin().string(), missing);
                case MissingPolicy::SKIP:
                    LOG_WARN("schema", "Skipping " + file.origin().filename().string() +
                             ": missing columns " + formatNameList(missing));
                    plan.skipped.push_back({file.origin().filename().string(), missing});
                    continue;
                case MissingPolicy::FILLNA:
                    LOG_DEBUG("schema", file.origin().filename().string() + ": null-filling " + formatNameList(missing));
                    break;
            }
        }
        plan.files.push_back(file);
        plan.mappings.push_back(std::move(mapping));
    }

    if (plan.files.empty()) {
        throw NoUsableFilesError("No files left after applying --columns and --missing-policy skip");
    }

    LOG_INFO("schema", "requested=" + formatNameList(requested) + " usable=" + std::to_string(plan.files.size()) +
             " skipped=" + std::to_string(plan.skipped.size()));
    return plan;
}

ColumnMapping SchemaReconciler::mapColumns(const SourceFile& file,
                                           const std::vector<std::string>& columns,
                                           bool case_insensitive,
                                           std::vector<std::string>* missing) {
    auto lookup = file.headerMap(case_insensitive);
    ColumnMapping mapping;
    mapping.source_index.reserve(columns.size());
    for (const auto& column : columns) {
        auto it = lookup.find(case_insensitive ? lowered(column) : column);
        if (it != lookup.end()) {
            mapping.source_index.emplace_back(it->second);
        } else {
            mapping.source_index.emplace_back(std::nullopt);
            if (missing) {
                missing->push_back(column);
            }
        }
    }
    return mapping;
}

} // namespace CSV
} // namespace ConCat
