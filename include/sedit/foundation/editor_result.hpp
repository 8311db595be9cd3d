#pragma once

/// @file editor_result.hpp
/// @brief EditorResult<T>: value-or-EditorError return type.
///
/// Operations that can fail for reasons the caller must handle (command
/// validation, scene and config I/O) return an EditorResult instead of
/// throwing.  Queries routinely made against stale ids do not use it;
/// they return null or empty values.

#include <optional>
#include <string>
#include <utility>

#include "sedit/foundation/editor_error.hpp"

namespace sedit::foundation {

/// Success value of type @p T, or the EditorError explaining why not.
///
/// Example:
/// @code
///   EditorResult<Transform> parseTransform(const YAML::Node& node) {
///       auto position = parseVector(node["position"]);
///       if (!position) {
///           return EditorResult<Transform>::propagate(position);
///       }
///       return EditorResult<Transform>::ok(Transform::At(position.value()));
///   }
/// @endcode
template <typename T>
class EditorResult {
public:
    static EditorResult ok(T value) { return EditorResult(std::move(value)); }
    static EditorResult err(EditorError error) { return EditorResult(std::move(error)); }
    static EditorResult err(ErrorCode code, std::string message) {
        return EditorResult(EditorError(code, std::move(message)));
    }

    /// Forward the error of a failed result of another type.
    template <typename U>
    static EditorResult propagate(const EditorResult<U>& failed) {
        return EditorResult(failed.error());
    }

    [[nodiscard]] bool hasValue() const noexcept { return value_.has_value(); }
    [[nodiscard]] bool hasError() const noexcept { return !value_.has_value(); }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Only valid on success.
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Only meaningful on failure.
    [[nodiscard]] const EditorError& error() const& { return error_; }

private:
    explicit EditorResult(T value) : value_(std::move(value)) {}
    explicit EditorResult(EditorError error) : error_(std::move(error)) {}

    std::optional<T> value_;
    EditorError error_;
};

/// Success/failure only.
template <>
class EditorResult<void> {
public:
    static EditorResult ok() { return EditorResult(); }
    static EditorResult err(EditorError error) { return EditorResult(std::move(error)); }
    static EditorResult err(ErrorCode code, std::string message) {
        return EditorResult(EditorError(code, std::move(message)));
    }

    /// Keep only the outcome of @p result, dropping its value.
    template <typename U>
    static EditorResult from(const EditorResult<U>& result) {
        return result ? ok() : err(result.error());
    }

    [[nodiscard]] bool hasValue() const noexcept { return !failed_; }
    [[nodiscard]] bool hasError() const noexcept { return failed_; }
    explicit operator bool() const noexcept { return !failed_; }

    [[nodiscard]] const EditorError& error() const& { return error_; }

private:
    EditorResult() = default;
    explicit EditorResult(EditorError error) : failed_(true), error_(std::move(error)) {}

    bool failed_ = false;
    EditorError error_;
};

} // namespace sedit::foundation
