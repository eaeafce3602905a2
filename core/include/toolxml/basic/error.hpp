// toolxml/basic/error.hpp - Exception types raised by the generator core
//
// Every failure in the core is fatal for the document being generated.
// The driver turns these into diagnostics; library callers catch them
// directly.
//
#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace toolxml
{

/**
 * Raised when the escape codec receives a value that is neither text nor
 * one of the absent/true/false sentinels.
 */
class UnsupportedValueError : public std::runtime_error
{
public:
  explicit UnsupportedValueError(const std::string & type_name)
  : std::runtime_error("unsupported value type: " + type_name), type_name_(type_name)
  {
  }

  [[nodiscard]] const std::string & type_name() const noexcept { return type_name_; }

private:
  std::string type_name_;
};

/**
 * Raised when a child tag at a tag-ordered level is missing from the
 * priority list that defines that level.
 */
class SchemaOrderError : public std::runtime_error
{
public:
  SchemaOrderError(const std::string & tag, const std::string & list_name)
  : std::runtime_error("unknown " + list_name + " tag '" + tag + "'"), tag_(tag)
  {
  }

  [[nodiscard]] const std::string & tag() const noexcept { return tag_; }

private:
  std::string tag_;
};

/**
 * Raised when the output file cannot be opened or written.
 */
class OutputError : public std::runtime_error
{
public:
  OutputError(const std::string & message, std::filesystem::path path)
  : std::runtime_error(message + ": " + path.string()), path_(std::move(path))
  {
  }

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

/**
 * Raised when a JSON tree description does not have the expected shape.
 */
class TreeFormatError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

}  // namespace toolxml
