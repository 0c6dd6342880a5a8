// src/types/error_codes/result.hpp
#pragma once

#include <sstream>
#include <string>
#include <vector>

#include "s2lp_error_codes.hpp"

namespace s2lp {

/**
 * @brief Struct representing a single error with code and message
 */
struct ErrorInfo {
    S2lpErrorCode code;   ///< The error code
    std::string message;  ///< The error message

    ErrorInfo(S2lpErrorCode error_code, std::string error_message)
        : code(error_code), message(std::move(error_message)) {}
};

/**
 * @brief Class representing the result of a driver operation
 *
 * Successful results carry nothing. Failed results carry the error code and
 * a human readable message, for configuration errors this is the reason the
 * value was rejected.
 */
class Result {
   public:
    /**
    * @brief Construct a new successful Result
    */
    Result() : has_errors_(false) {}

    /**
    * @brief Construct a new Result with a single error
    *
    * @param code The error code
    */
    explicit Result(S2lpErrorCode code) : has_errors_(false) {
        if (code == S2lpErrorCode::kSuccess) {
            return;
        }
        AddError(code, S2lpErrorCategory::GetInstance().message(
                           static_cast<int>(code)));
    }

    /**
    * @brief Construct a new Result with a single error and custom message
    *
    * @param code The error code
    * @param message Custom error message
    */
    Result(S2lpErrorCode code, std::string message) : has_errors_(true) {
        AddError(code, std::move(message));
    }

    bool IsSuccess() const { return !has_errors_; }

    /**
    * @brief Get the primary error code (first error if multiple exist)
    */
    S2lpErrorCode getErrorCode() const {
        return has_errors_ ? errors_[0].code : S2lpErrorCode::kSuccess;
    }

    /**
    * @brief Get a human-readable error message combining all errors
    */
    std::string GetErrorMessage() const {
        if (!has_errors_) {
            return "Success";
        }
        std::stringstream ss;
        for (size_t i = 0; i < errors_.size(); ++i) {
            if (i > 0) {
                ss << "\n";
            }
            ss << errors_[i].message;
        }
        return ss.str();
    }

    void AddError(S2lpErrorCode code, std::string message) {
        has_errors_ = true;
        errors_.emplace_back(code, std::move(message));
    }

    bool HasError(S2lpErrorCode code) const {
        for (const auto& error : errors_) {
            if (error.code == code) {
                return true;
            }
        }
        return false;
    }

    size_t GetErrorCount() const { return errors_.size(); }

    /**
    * @brief Convert to std::error_code for standard error handling
    */
    std::error_code AsErrorCode() const { return make_error_code(getErrorCode()); }

    /**
    * @brief Implicit conversion to bool for easy checking
    *
    * @return bool True if operation succeeded (no errors)
    */
    operator bool() const { return IsSuccess(); }

    static inline Result Success() { return Result(); }

    static inline Result Error(S2lpErrorCode code) { return Result(code); }

    /**
    * @brief Create a Result for an out of range argument
    *
    * @param message Description of why the argument is invalid
    */
    static inline Result InvalidArgument(const std::string& message) {
        return Result(S2lpErrorCode::kInvalidArgument, message);
    }

    /**
    * @brief Create a Result for a rejected configuration
    *
    * @param reason Names the offending field and why it was rejected
    */
    static inline Result BadConfig(const std::string& reason) {
        return Result(S2lpErrorCode::kBadConfig, reason);
    }

   private:
    bool has_errors_;                ///< Flag indicating if there are any errors
    std::vector<ErrorInfo> errors_;  ///< List of errors
};

}  // namespace s2lp
