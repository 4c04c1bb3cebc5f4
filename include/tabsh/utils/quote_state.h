/*
  quote_state.h

  This file is part of tabsh, a shell completion engine

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#pragma once

#include <cstdint>

namespace utils {

// Shell quoting state for a left-to-right scan of a command line. A backslash escapes
// the next character outside single quotes; single quotes take everything literally.
class QuoteTracker {
   public:
    enum class Role : std::uint8_t {
        Plain,   // unquoted, may split words
        Quoted,  // inside quotes or escaped
        Syntax   // the quote or backslash itself
    };

    Role feed(char c) {
        if (escape_pending_) {
            escape_pending_ = false;
            return Role::Quoted;
        }

        if (in_single_) {
            if (c == '\'') {
                in_single_ = false;
                return Role::Syntax;
            }
            return Role::Quoted;
        }

        if (c == '\\') {
            escape_pending_ = true;
            return Role::Syntax;
        }
        if (c == '"') {
            in_double_ = !in_double_;
            return Role::Syntax;
        }
        if (in_double_) {
            return Role::Quoted;
        }
        if (c == '\'') {
            in_single_ = true;
            return Role::Syntax;
        }
        return Role::Plain;
    }

    bool inside_quotes() const {
        return in_single_ || in_double_;
    }

   private:
    bool in_single_ = false;
    bool in_double_ = false;
    bool escape_pending_ = false;
};

}  // namespace utils
