/**
 * @file resource_name.cpp
 * @brief Resource name generation and parsing.
 */

#include "naming/resource_name.hpp"

#include <charconv>
#include <cctype>

namespace openstack_exporter {

namespace {

constexpr std::string_view kAlphabet =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

bool is_alnum(std::string_view text) noexcept {
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0) return false;
    }
    return true;
}

}  // anonymous namespace

std::string ResourceName::str() const {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        created.time_since_epoch()).count();
    return tag + "-" + suffix + "-" + std::to_string(seconds);
}

NameGenerator::NameGenerator() : rng_(std::random_device{}()) {}

NameGenerator::NameGenerator(uint64_t seed) : rng_(seed) {}

std::string NameGenerator::create(Timestamp now) {
    std::string suffix(kNameSuffixLength, '0');
    {
        std::lock_guard lock(mutex_);
        std::uniform_int_distribution<size_t> pick(0, kAlphabet.size() - 1);
        for (auto& c : suffix) {
            c = kAlphabet[pick(rng_)];
        }
    }

    ResourceName name{
        .tag = std::string{kResourceTag},
        .suffix = std::move(suffix),
        .created = std::chrono::time_point_cast<std::chrono::seconds>(now)
    };
    return name.str();
}

std::string create_name() {
    static NameGenerator generator;
    return generator.create();
}

std::optional<ResourceName> parse_name(std::string_view name) {
    if (name.size() <= kResourceTag.size() + 1) return std::nullopt;
    if (name.substr(0, kResourceTag.size()) != kResourceTag) return std::nullopt;
    if (name[kResourceTag.size()] != '-') return std::nullopt;

    auto rest = name.substr(kResourceTag.size() + 1);
    auto dash = rest.rfind('-');
    if (dash == std::string_view::npos || dash == 0) return std::nullopt;

    auto suffix = rest.substr(0, dash);
    auto stamp = rest.substr(dash + 1);
    if (stamp.empty() || !is_alnum(suffix)) return std::nullopt;

    int64_t seconds = 0;
    auto [ptr, ec] = std::from_chars(stamp.data(), stamp.data() + stamp.size(), seconds);
    if (ec != std::errc{} || ptr != stamp.data() + stamp.size() || seconds < 0) {
        return std::nullopt;
    }

    return ResourceName{
        .tag = std::string{kResourceTag},
        .suffix = std::string{suffix},
        .created = Timestamp{std::chrono::seconds{seconds}}
    };
}

bool has_resource_tag(std::string_view name) noexcept {
    return name.size() > kResourceTag.size()
        && name.substr(0, kResourceTag.size()) == kResourceTag
        && name[kResourceTag.size()] == '-';
}

std::optional<std::chrono::seconds> resource_age(std::string_view name, Timestamp now) {
    auto parsed = parse_name(name);
    if (!parsed) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::seconds>(now - parsed->created);
}

}  // namespace openstack_exporter
