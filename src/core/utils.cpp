#include "chatstore/core/utils.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <random>

#include <uuid.h>

namespace chatstore::utils {

auto generate_uuid() -> std::string {
    static thread_local std::mt19937 rng(std::random_device{}());
    auto gen = uuids::uuid_random_generator(rng);
    return uuids::to_string(gen());
}

auto timestamp_ns() -> int64_t {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

namespace {

constexpr std::string_view kB64UrlTable =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr uint8_t kInvalid = 0xFF;

constexpr auto make_b64url_decode_table() -> std::array<uint8_t, 256> {
    std::array<uint8_t, 256> t{};
    t.fill(kInvalid);
    for (size_t i = 0; i < kB64UrlTable.size(); ++i) {
        t[static_cast<uint8_t>(kB64UrlTable[i])] = static_cast<uint8_t>(i);
    }
    return t;
}

} // namespace

auto base64url_encode(std::string_view data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        auto a = static_cast<uint8_t>(data[i++]);
        auto b = static_cast<uint8_t>(data[i++]);
        auto c = static_cast<uint8_t>(data[i++]);
        result += kB64UrlTable[(a >> 2) & 0x3F];
        result += kB64UrlTable[((a & 0x03) << 4) | ((b >> 4) & 0x0F)];
        result += kB64UrlTable[((b & 0x0F) << 2) | ((c >> 6) & 0x03)];
        result += kB64UrlTable[c & 0x3F];
    }
    if (i < data.size()) {
        auto a = static_cast<uint8_t>(data[i++]);
        result += kB64UrlTable[(a >> 2) & 0x3F];
        if (i < data.size()) {
            auto b = static_cast<uint8_t>(data[i]);
            result += kB64UrlTable[((a & 0x03) << 4) | ((b >> 4) & 0x0F)];
            result += kB64UrlTable[((b & 0x0F) << 2)];
        } else {
            result += kB64UrlTable[(a & 0x03) << 4];
            result += '=';
        }
        result += '=';
    }
    return result;
}

auto base64url_decode(std::string_view data) -> std::optional<std::string> {
    static constexpr auto table = make_b64url_decode_table();

    if (data.size() % 4 != 0) return std::nullopt;

    size_t padding = 0;
    if (!data.empty() && data.back() == '=') ++padding;
    if (data.size() >= 2 && data[data.size() - 2] == '=') ++padding;
    auto body = data.substr(0, data.size() - padding);

    std::string result;
    result.reserve((data.size() / 4) * 3);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : body) {
        auto v = table[static_cast<uint8_t>(c)];
        if (v == kInvalid) return std::nullopt;
        buf = (buf << 6) | v;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result += static_cast<char>((buf >> bits) & 0xFF);
        }
    }
    return result;
}

auto format_rfc3339(Timestamp ts) -> std::string {
    using namespace std::chrono;

    auto ns_total = time_point_cast<nanoseconds>(ts);
    auto day = floor<days>(ns_total);
    year_month_day ymd{day};
    hh_mm_ss tod{ns_total - day};
    auto frac = (ns_total - floor<seconds>(ns_total)).count();

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()));

    std::string out(buf);
    if (frac > 0) {
        char fbuf[16];
        std::snprintf(fbuf, sizeof(fbuf), ".%09lld", static_cast<long long>(frac));
        std::string f(fbuf);
        while (f.back() == '0') f.pop_back();
        out += f;
    }
    out += 'Z';
    return out;
}

auto parse_rfc3339(std::string_view s) -> std::optional<Timestamp> {
    using namespace std::chrono;

    if (s.size() < 20) return std::nullopt;

    auto number = [&s](size_t pos, size_t len) -> std::optional<int> {
        int v = 0;
        for (size_t i = pos; i < pos + len; ++i) {
            if (s[i] < '0' || s[i] > '9') return std::nullopt;
            v = v * 10 + (s[i] - '0');
        }
        return v;
    };

    if (s[4] != '-' || s[7] != '-' || s[13] != ':' || s[16] != ':') return std::nullopt;
    if (s[10] != 'T' && s[10] != 't') return std::nullopt;

    auto y = number(0, 4);
    auto mo = number(5, 2);
    auto d = number(8, 2);
    auto h = number(11, 2);
    auto mi = number(14, 2);
    auto sec = number(17, 2);
    if (!y || !mo || !d || !h || !mi || !sec) return std::nullopt;
    if (*h > 23 || *mi > 59 || *sec > 59) return std::nullopt;

    year_month_day ymd{year{*y}, month{static_cast<unsigned>(*mo)},
                       day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) return std::nullopt;

    size_t pos = 19;
    int64_t frac_ns = 0;
    if (s[pos] == '.') {
        ++pos;
        auto start = pos;
        int64_t scale = 100'000'000;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            frac_ns += (s[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        if (pos == start) return std::nullopt;
    }

    if (pos >= s.size()) return std::nullopt;

    int64_t offset_seconds = 0;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        ++pos;
    } else if (s[pos] == '+' || s[pos] == '-') {
        if (s.size() - pos != 6 || s[pos + 3] != ':') return std::nullopt;
        auto oh = number(pos + 1, 2);
        auto om = number(pos + 4, 2);
        if (!oh || !om || *oh > 23 || *om > 59) return std::nullopt;
        offset_seconds = (*oh * 3600 + *om * 60) * (s[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    auto local = sys_days{ymd} + hours{*h} + minutes{*mi} + seconds{*sec};
    auto utc = local - seconds{offset_seconds};
    auto ns = duration_cast<nanoseconds>(utc.time_since_epoch()).count() + frac_ns;
    return from_unix_nanos(ns);
}

} // namespace chatstore::utils
