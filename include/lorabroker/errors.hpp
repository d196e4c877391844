/**
 * @file errors.hpp
 * @brief Error kinds and the Error value every broker stage reports with.
 *
 * @details
 * Three kinds, used the same way everywhere in the broker:
 *
 * | Kind        | Meaning                                              | Retry?                       |
 * |-------------|------------------------------------------------------|------------------------------|
 * | Structural  | the input itself is malformed or not acceptable      | no, not with the same bytes  |
 * | Behavioural | well-formed, but matches no known/authenticated peer | only after the registry changes |
 * | Operational | a downstream delivery or backend failure             | yes, with backoff            |
 *
 * Operations return an `Error` and hand their results back through
 * out-parameters. A default-constructed `Error` is success:
 *
 * @code
 * std::vector<lorabroker::DeviceEntry> entries;
 * lorabroker::Error err = storage.lookup_devices(addr, entries);
 * if (err) {
 *     std::cerr << lorabroker::to_pretty(err) << "\n";   // kind=behavioural reason=...
 * }
 * @endcode
 *
 * The broker never reclassifies a collaborator's kind except where it does
 * its own classification (decode -> Structural, lookup/disambiguation ->
 * Behavioural).
 */
#ifndef LORABROKER_ERRORS_HPP
#define LORABROKER_ERRORS_HPP

#include <stdint.h>
#include <stdexcept>
#include <string>

namespace lorabroker {

enum class ErrorKind : uint8_t {
    None        = 0,
    Structural  = 1,
    Behavioural = 2,
    Operational = 3
};

/**
 * @brief Classified failure (or success, when `kind == None`).
 */
struct Error {
    ErrorKind   kind = ErrorKind::None;
    std::string reason;

    Error() = default;
    Error(ErrorKind k, std::string why);

    /// @brief true when this value carries a failure.
    explicit operator bool() const { return kind != ErrorKind::None; }

    bool is(ErrorKind k) const { return kind == k; }
};

/// @brief Lower-case name of a kind ("structural", "behavioural", ...).
const char* to_string(ErrorKind kind);

/// @brief One-line `kind=<k> reason=<r>` rendering; "kind=none" on success.
std::string to_pretty(const Error& err);

/**
 * @brief Raised when an internal invariant of the broker does not hold.
 *
 * Not part of the three-kind taxonomy. The only producer today is the MIC
 * match step finding more than one device that authenticates the same frame.
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

} // namespace lorabroker

#endif // LORABROKER_ERRORS_HPP
