#ifndef FILTER_UTILS_HPP
#define FILTER_UTILS_HPP

#include "../ur-resolverbench-shared/include/RunConfigSerializer.hpp"
#include "../ur-resolverbench-shared/include/TargetSerializer.hpp"
#include <string>
#include <vector>

using ResolverBench::Shared::CatalogFilters;
using ResolverBench::Shared::Target;

// String utilities
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
std::string trim(const std::string& str);

// Two ASCII letters, upper case.
bool is_country_code(const std::string& code);

// Target filtering
bool matches_filter(const Target& target, const CatalogFilters& filters);
std::vector<Target> filter_targets(const std::vector<Target>& targets, const CatalogFilters& filters);

#endif // FILTER_UTILS_HPP
