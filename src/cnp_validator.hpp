#ifndef CNP_VALIDATOR_HPP
#define CNP_VALIDATOR_HPP

#include <string>

// Outcome of validating a Romanian personal numeric code (CNP).
// reason is a short machine-readable code: "length", "format", "century",
// "date", "year" or "checksum". message is the human-readable form.
struct CnpValidation {
    bool valid;
    std::string reason;
    std::string message;

    CnpValidation() : valid(false) {}
};

// Layout: S YY MM DD JJ NNN C
//   S   - sex and century, JJ - county code, NNN - serial, C - control digit
CnpValidation validateCnp(const std::string& cnp);

// Same as validateCnp, with the reference year supplied by the caller
CnpValidation validateCnp(const std::string& cnp, int currentYear);

// "YYYY-MM-DD" for a valid CNP, empty string otherwise
std::string extractBirthDateFromCnp(const std::string& cnp);

// "M" or "F" for a valid CNP, empty string otherwise
std::string extractGenderFromCnp(const std::string& cnp);

// Control digit computed from the first 12 digits, or -1 if they are not digits
int computeCnpControlDigit(const std::string& cnp);

#endif // CNP_VALIDATOR_HPP
