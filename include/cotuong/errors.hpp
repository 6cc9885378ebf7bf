#pragma once
#include <stdexcept>
#include <string>

namespace cotuong {

// Base for every recoverable failure the core reports to its caller.
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Malformed position notation, move text or configuration text.
class ParseError : public Error {
 public:
  using Error::Error;
};

// makeMove() with a from/to pair that matches no legal move, or in a finished game.
class IllegalMoveError : public Error {
 public:
  using Error::Error;
};

// A caller broke a precondition (moving from an empty or enemy square, undo on empty history).
class InvalidStateError : public Error {
 public:
  using Error::Error;
};

}  // namespace cotuong
