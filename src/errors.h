#ifndef SHELLFRAME_ERRORS_H
#define SHELLFRAME_ERRORS_H

#include <stdexcept>
#include <string>
#include <utility>

namespace shellframe {

class Error : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public Error {
   public:
    using Error::Error;
};

class FontDirectoryReadError : public Error {
   public:
    using Error::Error;
};

// base for errors that concern a single style variant of the font set
class FontStyleError : public Error {
   public:
    FontStyleError(const std::string &message, std::string style)
        : Error {message}, style_ {std::move(style)} {}

    [[nodiscard]] auto style() const noexcept -> const std::string & {
        return style_;
    }

   private:
    std::string style_;
};

class DuplicateFontError : public FontStyleError {
   public:
    using FontStyleError::FontStyleError;
};

class MissingFontError : public FontStyleError {
   public:
    using FontStyleError::FontStyleError;
};

class FontParseError : public Error {
   public:
    using Error::Error;
};

class InputStreamError : public Error {
   public:
    using Error::Error;
};

class BlurProcessingError : public Error {
   public:
    using Error::Error;
};

class EncodingError : public Error {
   public:
    using Error::Error;
};

}  // namespace shellframe

#endif
