#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace quasar
{

  struct MdbError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  class VectorError : public std::runtime_error
  {
  public:
    enum class Code : uint8_t
    {
      VectorNotFound,
      VectorDeleted,
      InvalidVectorLength,
      InvalidVectorData,
      EntryPointNotFound,
      Conversion,
      VectorCore,
      VectorAlreadyDeleted,
    };

    VectorError(Code code, const std::string &what) : std::runtime_error(what), code_(code) {}

    Code code() const noexcept { return code_; }

  private:
    Code code_;
  };

  class GraphError : public std::runtime_error
  {
  public:
    enum class Code : uint8_t
    {
      Io,
      Storage,
      Traversal,
      Conversion,
      Decode,
      EdgeNotFound,
      NodeNotFound,
      LabelNotFound,
      Vector,
      New,
      SliceLength,
      ShortestPathNotFound,
      DuplicateKey,
      IoNeeded,
    };

    GraphError(Code code, const std::string &what) : std::runtime_error(what), code_(code) {}

    explicit GraphError(const VectorError &e)
        : std::runtime_error(e.what()), code_(Code::Vector), vectorCode_(e.code()), hasVectorCode_(true) {}

    explicit GraphError(const MdbError &e)
        : std::runtime_error(std::string("storage error: ") + e.what()), code_(Code::Storage) {}

    Code code() const noexcept { return code_; }

    // only meaningful when code() == Code::Vector
    bool hasVectorCode() const noexcept { return hasVectorCode_; }
    VectorError::Code vectorCode() const noexcept { return vectorCode_; }

  private:
    Code code_;
    VectorError::Code vectorCode_{VectorError::Code::VectorCore};
    bool hasVectorCode_{false};
  };

  const char *codeName(GraphError::Code code);
  const char *codeName(VectorError::Code code);

} // namespace quasar
