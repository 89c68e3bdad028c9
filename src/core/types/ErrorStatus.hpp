/**
 * @file ErrorStatus.hpp
 * @brief RFC 3416 error-status codes.
 */

#pragma once

#include <string>

namespace snmpwire::core {

/**
 * @brief Error-status value carried in a Response-PDU.
 */
class ErrorStatus {
public:
    /** @name RFC 3416 codes
     *  @{ */
    static constexpr int NoError = 0;
    static constexpr int TooBig = 1;
    static constexpr int NoSuchName = 2;
    static constexpr int BadValue = 3;
    static constexpr int ReadOnly = 4;
    static constexpr int GenErr = 5;
    static constexpr int NoAccess = 6;
    static constexpr int WrongType = 7;
    static constexpr int WrongLength = 8;
    static constexpr int WrongEncoding = 9;
    static constexpr int WrongValue = 10;
    static constexpr int NoCreation = 11;
    static constexpr int InconsistentValue = 12;
    static constexpr int ResourceUnavailable = 13;
    static constexpr int CommitFailed = 14;
    static constexpr int UndoFailed = 15;
    static constexpr int AuthorizationError = 16;
    static constexpr int NotWritable = 17;
    static constexpr int InconsistentName = 18;
    /** @} */

    constexpr explicit ErrorStatus(int code) : code_(code) {}

    [[nodiscard]] constexpr int code() const { return code_; }

    /**
     * @brief Text form of the code, e.g. "no such name".
     *
     * Codes outside 0-18 render as "code N".
     */
    [[nodiscard]] std::string toString() const;

    constexpr bool operator==(const ErrorStatus& other) const = default;

private:
    int code_;
};

} // namespace snmpwire::core
