#include "address_range.hpp"
#include <core/utils.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <array>
#include <cstring>
#include <fmt/format.h>

namespace {

struct ParsedRange {
    int family = AF_INET;
    std::array<unsigned char, 16> base{};  // network address, host bits cleared
    int addr_len = 4;                      // bytes used in base
    int host_bits = 0;
};

Result<ParsedRange> parse_range(const std::string& input) {
    std::string range = input;
    trim(range);
    if (range.empty()) {
        return Result<ParsedRange>::Err(ErrorKind::Resource, "empty address range");
    }

    std::string addr = range;
    int prefix = -1;
    auto slash = range.find('/');
    if (slash != std::string::npos) {
        addr = range.substr(0, slash);
        std::string bits = range.substr(slash + 1);
        if (bits.empty() || bits.size() > 3 ||
            bits.find_first_not_of("0123456789") != std::string::npos) {
            return Result<ParsedRange>::Err(ErrorKind::Resource,
                fmt::format("invalid prefix length in '{}'", range));
        }
        prefix = safe_stoi(bits, -1);
    }

    ParsedRange p;
    if (inet_pton(AF_INET, addr.c_str(), p.base.data()) == 1) {
        p.family = AF_INET;
        p.addr_len = 4;
    } else if (inet_pton(AF_INET6, addr.c_str(), p.base.data()) == 1) {
        p.family = AF_INET6;
        p.addr_len = 16;
    } else {
        return Result<ParsedRange>::Err(ErrorKind::Resource,
            fmt::format("invalid address range '{}'", range));
    }

    int max_bits = p.addr_len * 8;
    if (prefix < 0) prefix = max_bits;
    if (prefix > max_bits) {
        return Result<ParsedRange>::Err(ErrorKind::Resource,
            fmt::format("prefix /{} too long for '{}'", prefix, addr));
    }
    p.host_bits = max_bits - prefix;

    // Clear host bits
    for (int bit = prefix; bit < max_bits; ++bit) {
        p.base[bit / 8] &= static_cast<unsigned char>(~(0x80 >> (bit % 8)));
    }
    return Result<ParsedRange>::Ok(p);
}

size_t capped_count(int host_bits, size_t cap) {
    // 2^host_bits overflows size_t long before IPv6 prefixes run out
    if (host_bits >= 63) return cap;
    uint64_t n = uint64_t(1) << host_bits;
    return n < cap ? static_cast<size_t>(n) : cap;
}

void increment(std::array<unsigned char, 16>& a, int len) {
    for (int i = len - 1; i >= 0; --i) {
        if (++a[i] != 0) break;
    }
}

} // namespace

Result<std::vector<std::string>> expand_address_range(const std::string& range, size_t cap) {
    using R = Result<std::vector<std::string>>;
    auto parsed = parse_range(range);
    if (parsed.is_err()) return R::Err(parsed.kind, parsed.error);
    const auto& p = parsed.value;

    size_t n = capped_count(p.host_bits, cap);
    std::vector<std::string> out;
    out.reserve(n);

    auto cur = p.base;
    char text[INET6_ADDRSTRLEN];
    for (size_t i = 0; i < n; ++i) {
        if (!inet_ntop(p.family, cur.data(), text, sizeof(text))) {
            return R::Err(ErrorKind::Resource, fmt::format("cannot format address in '{}'", range));
        }
        out.emplace_back(text);
        increment(cur, p.addr_len);
    }
    return R::Ok(std::move(out));
}

Result<size_t> count_address_range(const std::string& range, size_t cap) {
    auto parsed = parse_range(range);
    if (parsed.is_err()) return Result<size_t>::Err(parsed.kind, parsed.error);
    return Result<size_t>::Ok(capped_count(parsed.value.host_bits, cap));
}

Result<size_t> estimate_probe_count(const std::string& range, const std::vector<int>& ports) {
    auto n = count_address_range(range);
    if (n.is_err()) return n;
    // No ports means the default SSH port
    size_t port_count = ports.empty() ? 1 : ports.size();
    return Result<size_t>::Ok(n.value * port_count);
}
