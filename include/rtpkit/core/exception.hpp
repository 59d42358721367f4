/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2024 Owllab. All rights reserved.
 */

#pragma once

#include "platform.hpp"

#include <exception>
#include <ostream>
#include <string>

#include <fmt/ostream.h>

#define RTPKIT_THROW_EXCEPTION(msg) throw rtpkit::Exception(msg, __FILE__, __LINE__, RTPKIT_FUNCTION)

namespace rtpkit {

/**
 * Exception type thrown for errors which are the result of a wrong configuration by the caller, for example
 * constructing a packetizer with an MTU which cannot hold a single byte of payload.
 */
class Exception: public std::exception {
  public:
    explicit
    Exception(const char* msg, const char* file = nullptr, const int line = -1, const char* function_name = nullptr) :
        error_(msg), file_(file), line_(line), function_name_(function_name) {}

    explicit
    Exception(std::string msg, const char* file = nullptr, const int line = -1, const char* function_name = nullptr) :
        error_(std::move(msg)), file_(file), line_(line), function_name_(function_name) {}

    /**
     * @returns The error message.
     */
    [[nodiscard]] const char* what() const noexcept override {
        return error_.c_str();
    }

    /**
     * @return The file where the error occurred.
     */
    [[nodiscard]] const char* file() const {
        return file_;
    }

    /**
     * @return The line number where the error occurred.
     */
    [[nodiscard]] int line() const {
        return line_;
    }

    /**
     * @return The name of the function where the error occurred.
     */
    [[nodiscard]] const char* function_name() const {
        return function_name_;
    }

    /**
     * @return The message followed by the location where the exception was thrown, if known:
     * "message (file.cpp:42 in function)".
     */
    [[nodiscard]] std::string to_string() const {
        if (file_ == nullptr) {
            return error_;
        }

        std::string result = error_ + " (" + file_name() + ":" + std::to_string(line_);
        if (function_name_ != nullptr) {
            result += " in ";
            result += function_name_;
        }
        return result + ")";
    }

    friend std::ostream& operator<<(std::ostream& os, const Exception& e) {
        return os << e.to_string();
    }

  private:
    std::string error_;
    const char* file_ {};
    int line_ {};
    const char* function_name_ {};

    /// __FILE__ without the directories.
    [[nodiscard]] std::string file_name() const {
        std::string path(file_);
        const auto pos = path.find_last_of("/\\");
        return pos == std::string::npos ? path : path.substr(pos + 1);
    }
};

}  // namespace rtpkit

/// Make rtpkit::Exception printable with fmt
template<>
struct fmt::formatter<rtpkit::Exception>: ostream_formatter {};
