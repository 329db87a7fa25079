#ifndef PROPCHECK_MISUSE_ERROR_H
#define PROPCHECK_MISUSE_ERROR_H

#include <stdexcept>
#include <string>

/* Thrown when a generator is built or driven with arguments that can never
   produce a value: an empty choice list, an inverted range, a negative
   sampled length.

   This is a programming error in the test code, so it is never caught by the
   checker. It escapes `run`/`check` like any other defect in generator code.
 */
class MisuseError : public std::logic_error {
public:
    explicit MisuseError(const std::string &msg) : std::logic_error(msg) {}
};

#endif//PROPCHECK_MISUSE_ERROR_H
