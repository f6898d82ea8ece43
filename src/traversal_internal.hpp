#pragma once
#include "encode.hpp"
#include "traversal.hpp"
#include <deque>
#include <utility>

namespace quasar::ops::detail
{

  // Runs fn and turns storage/vector failures into a failed item.
  template <typename F>
  Item guarded(F &&fn)
  {
    try
    {
      return Item(TraversalValue(fn()));
    }
    catch (const GraphError &e)
    {
      return Item(e);
    }
    catch (const VectorError &e)
    {
      return Item(GraphError(e));
    }
    catch (const MdbError &e)
    {
      return Item(GraphError(e));
    }
  }

  // true if fn failed; the failure is left in err
  template <typename F>
  bool capture(F &&fn, std::optional<GraphError> &err)
  {
    try
    {
      fn();
      return false;
    }
    catch (const GraphError &e)
    {
      err.emplace(e);
    }
    catch (const VectorError &e)
    {
      err.emplace(GraphError(e));
    }
    catch (const MdbError &e)
    {
      err.emplace(GraphError(e));
    }
    return true;
  }

  // Flat-map: expand each successful upstream item into a batch of items.
  // Failed upstream items pass through untouched.
  template <typename Expand>
  StreamPtr flatMap(StreamPtr up, Expand expand)
  {
    return makeStream([up = std::move(up), expand = std::move(expand), pending = std::deque<Item>()]() mutable
                      -> std::optional<Item>
                      {
      while (pending.empty())
      {
        auto item = up->next();
        if (!item)
          return std::nullopt;
        if (!item->ok())
          return item;
        std::optional<GraphError> err;
        if (capture([&] { expand(item->value(), pending); }, err))
          return Item(std::move(*err));
      }
      Item out = std::move(pending.front());
      pending.pop_front();
      return out; });
  }

  // Errors from materializing all of upstream are kept in order with the values.
  std::vector<Item> drain(StreamPtr &up);

  std::vector<AdjacencyEntry> adjacency(const Txn &tx, DbHandle dbi, Id nodeId, uint32_t labelHash);

} // namespace quasar::ops::detail
