#pragma once

#include <cstdint>
#include <functional>
#include <string_view>
#include <variant>

#include "meshlink/core/types.hpp"
#include "meshlink/core/error.hpp"
#include "meshlink/core/link/endpoint.hpp"


namespace meshlink::core::operation {

// Final outcome of a queued operation
struct Result {
    Error error{Error::None};
    int status{0};
    Bytes data{};

    [[nodiscard]]
    bool ok() const noexcept { return error == Error::None; }
};

using ResultSink = std::function<void(const Result&)>;

inline constexpr std::uint8_t FIRST_ATTEMPT = 1;

struct Write {
    link::Characteristic target{link::Characteristic::ToRadio};
    Bytes payload{};
    ResultSink sink{};
};

struct Read {
    link::Characteristic target{link::Characteristic::FromRadio};
    ResultSink sink{};
    std::uint8_t attempt{FIRST_ATTEMPT};
};

struct SetNotify {
    link::Characteristic target{link::Characteristic::FromNum};
    bool enable{true};
    ResultSink sink{};
};

struct ReliableWrite {
    link::Characteristic target{link::Characteristic::ToRadio};
    Bytes payload{};
    ResultSink sink{};
    std::uint8_t attempt{FIRST_ATTEMPT};
};

using Operation = std::variant<Write, Read, SetNotify, ReliableWrite>;

enum class Kind : std::uint8_t {
    Write,
    Read,
    SetNotify,
    ReliableWrite
};

[[nodiscard]]
inline constexpr std::string_view to_string(Kind k) noexcept {
    switch (k) {
    case Kind::Write:         return "Write";
    case Kind::Read:          return "Read";
    case Kind::SetNotify:     return "SetNotify";
    case Kind::ReliableWrite: return "ReliableWrite";
    default:                  return "Unknown";
    }
}

[[nodiscard]]
inline Kind kind_of(const Operation& op) noexcept {
    return static_cast<Kind>(op.index());
}

// Retry counter of retryable operations, nullptr for Write and SetNotify
[[nodiscard]]
inline std::uint8_t* attempt_of(Operation& op) noexcept {
    if (auto* r = std::get_if<Read>(&op)) {
        return &r->attempt;
    }
    if (auto* rw = std::get_if<ReliableWrite>(&op)) {
        return &rw->attempt;
    }
    return nullptr;
}

[[nodiscard]]
inline const ResultSink& sink_of(const Operation& op) noexcept {
    return std::visit([](const auto& o) -> const ResultSink& { return o.sink; }, op);
}

} // namespace meshlink::core::operation
