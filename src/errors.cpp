#include "errors.hpp"

namespace quasar
{

  const char *codeName(GraphError::Code code)
  {
    switch (code)
    {
    case GraphError::Code::Io:
      return "Io";
    case GraphError::Code::Storage:
      return "Storage";
    case GraphError::Code::Traversal:
      return "Traversal";
    case GraphError::Code::Conversion:
      return "Conversion";
    case GraphError::Code::Decode:
      return "Decode";
    case GraphError::Code::EdgeNotFound:
      return "EdgeNotFound";
    case GraphError::Code::NodeNotFound:
      return "NodeNotFound";
    case GraphError::Code::LabelNotFound:
      return "LabelNotFound";
    case GraphError::Code::Vector:
      return "Vector";
    case GraphError::Code::New:
      return "New";
    case GraphError::Code::SliceLength:
      return "SliceLength";
    case GraphError::Code::ShortestPathNotFound:
      return "ShortestPathNotFound";
    case GraphError::Code::DuplicateKey:
      return "DuplicateKey";
    case GraphError::Code::IoNeeded:
      return "IoNeeded";
    }
    return "Unknown";
  }

  const char *codeName(VectorError::Code code)
  {
    switch (code)
    {
    case VectorError::Code::VectorNotFound:
      return "VectorNotFound";
    case VectorError::Code::VectorDeleted:
      return "VectorDeleted";
    case VectorError::Code::InvalidVectorLength:
      return "InvalidVectorLength";
    case VectorError::Code::InvalidVectorData:
      return "InvalidVectorData";
    case VectorError::Code::EntryPointNotFound:
      return "EntryPointNotFound";
    case VectorError::Code::Conversion:
      return "Conversion";
    case VectorError::Code::VectorCore:
      return "VectorCore";
    case VectorError::Code::VectorAlreadyDeleted:
      return "VectorAlreadyDeleted";
    }
    return "Unknown";
  }

} // namespace quasar
