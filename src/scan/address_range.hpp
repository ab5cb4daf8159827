#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>

// Expand "10.0.0.0/24", "fd00::/120" or a single IPv4/IPv6 address into an
// explicit list in ascending order. CIDR blocks include their network and
// broadcast addresses. At most cap entries are returned.
// A malformed range is a Resource error.
Result<std::vector<std::string>> expand_address_range(const std::string& range,
                                                      size_t cap = SCAN_MAX_ADDRESSES);

// Number of addresses the range expands to, after the cap, without
// materialising the list.
Result<size_t> count_address_range(const std::string& range, size_t cap = SCAN_MAX_ADDRESSES);

// Addresses (capped) times ports.
Result<size_t> estimate_probe_count(const std::string& range, const std::vector<int>& ports);
