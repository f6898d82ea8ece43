#include "traversal_internal.hpp"
#include "codec.hpp"
#include <lmdb.h>

namespace quasar
{

  StreamPtr emptyStream()
  {
    return makeStream([]() -> std::optional<Item>
                      { return std::nullopt; });
  }

  StreamPtr itemsStream(std::vector<Item> items)
  {
    return makeStream([items = std::move(items), pos = size_t(0)]() mutable -> std::optional<Item>
                      {
      if (pos >= items.size())
        return std::nullopt;
      return std::move(items[pos++]); });
  }

  namespace ops
  {

    namespace detail
    {
      std::vector<Item> drain(StreamPtr &up)
      {
        std::vector<Item> out;
        while (auto item = up->next())
          out.push_back(std::move(*item));
        return out;
      }
    } // namespace detail

    namespace
    {
      // Emits exactly one item computed on first pull.
      template <typename F>
      StreamPtr once(F fn)
      {
        return makeStream([fn = std::move(fn), done = false]() mutable -> std::optional<Item>
                          {
          if (done)
            return std::nullopt;
          done = true;
          return detail::guarded(fn); });
      }

      // Full-table scan yielding decode(key, value) for records whose label
      // matches. decode returns std::nullopt to skip a record.
      template <typename Decode>
      StreamPtr labelScan(const TraversalContext &ctx, DbHandle dbi, std::string label, Decode decode)
      {
        struct State
        {
          std::optional<Cursor> cur;
          bool done = false;
        };
        return makeStream([ctx, dbi, label = std::move(label), decode = std::move(decode), st = State{}]() mutable
                          -> std::optional<Item>
                          {
          while (!st.done)
          {
            MDB_val k{}, v{};
            std::optional<GraphError> err;
            bool found = false;
            if (detail::capture([&]
                                {
                                  if (!st.cur)
                                  {
                                    st.cur.emplace(ctx.txn, dbi);
                                    found = st.cur->first(k, v);
                                  }
                                  else
                                    found = st.cur->next(k, v); },
                                err))
            {
              st.done = true;
              return Item(std::move(*err));
            }
            if (!found)
            {
              st.done = true;
              break;
            }
            std::string_view bytes(static_cast<const char *>(v.mv_data), v.mv_size);
            if (k.mv_size != kIdSize || peekLabel(bytes) != label)
              continue;
            Id id = read_be128(static_cast<const unsigned char *>(k.mv_data));
            std::optional<TraversalValue> value;
            if (detail::capture([&]
                                { value = decode(id, bytes); },
                                err))
              return Item(std::move(*err));
            if (value)
              return Item(std::move(*value));
          }
          st.cur.reset();
          return std::nullopt; });
      }
    } // namespace

    StreamPtr nFromId(const TraversalContext &ctx, Id id)
    {
      return once([ctx, id]
                  { return ctx.storage.getNode(ctx.txn, ctx.arena, id); });
    }

    StreamPtr nFromType(const TraversalContext &ctx, std::string label)
    {
      return labelScan(ctx, ctx.storage.env().nodes(), std::move(label),
                       [ctx](Id id, std::string_view bytes) -> std::optional<TraversalValue>
                       { return TraversalValue(ctx.storage.nodeFromRecord(id, bytes, ctx.arena)); });
    }

    StreamPtr nFromIndex(const TraversalContext &ctx, std::string label, std::string index, Value value)
    {
      return makeStream([ctx, label = std::move(label), index = std::move(index), value = std::move(value),
                         ids = std::vector<Id>(), pos = size_t(0), loaded = false]() mutable -> std::optional<Item>
                        {
        if (!loaded)
        {
          loaded = true;
          std::optional<GraphError> err;
          if (detail::capture([&]
                              { ids = ctx.storage.lookupIndex(ctx.txn, index, value); },
                              err))
            return Item(std::move(*err));
        }
        while (pos < ids.size())
        {
          Id id = ids[pos++];
          Item item = detail::guarded([&]
                                      { return ctx.storage.getNode(ctx.txn, ctx.arena, id); });
          if (!item.ok() || item.value().label() == label)
            return item;
        }
        return std::nullopt; });
    }

    StreamPtr eFromId(const TraversalContext &ctx, Id id)
    {
      return once([ctx, id]
                  { return ctx.storage.getEdge(ctx.txn, ctx.arena, id); });
    }

    StreamPtr eFromType(const TraversalContext &ctx, std::string label)
    {
      return labelScan(ctx, ctx.storage.env().edges(), std::move(label),
                       [ctx](Id id, std::string_view bytes) -> std::optional<TraversalValue>
                       { return TraversalValue(decodeEdge(id, bytes, ctx.arena)); });
    }

    StreamPtr vFromId(const TraversalContext &ctx, Id id, bool withData)
    {
      return once([ctx, id, withData]() -> TraversalValue
                  {
        VectorWithoutData meta = ctx.storage.getVectorWithoutData(ctx.txn, ctx.arena, id);
        if (meta.deleted)
          throw GraphError(VectorError(VectorError::Code::VectorDeleted, "vector deleted " + idToString(id)));
        if (withData)
          return ctx.storage.getVector(ctx.txn, ctx.arena, id);
        return meta; });
    }

    StreamPtr vFromType(const TraversalContext &ctx, std::string label, bool withData)
    {
      return labelScan(ctx, ctx.storage.env().vectorProperties(), std::move(label),
                       [ctx, withData](Id id, std::string_view bytes) -> std::optional<TraversalValue>
                       {
                         VectorWithoutData meta = decodeVectorProperties(id, bytes, ctx.arena);
                         if (meta.deleted)
                           return std::nullopt;
                         if (!withData)
                           return TraversalValue(meta);
                         HVector v{};
                         v.id = meta.id;
                         v.label = meta.label;
                         v.version = meta.version;
                         v.level = meta.level;
                         v.properties = meta.properties;
                         v.data = ctx.storage.vectors().getPayload(ctx.txn, ctx.arena, id);
                         return TraversalValue(v);
                       });
    }

    StreamPtr addN(const TraversalContext &ctx, std::string label, Properties props)
    {
      return once([ctx, label = std::move(label), props = std::move(props)]() mutable
                  { return ctx.storage.addNode(ctx.txn, ctx.arena, label, std::move(props)); });
    }

    StreamPtr addE(const TraversalContext &ctx, std::string label, Properties props, Id from, Id to)
    {
      return once([ctx, label = std::move(label), props = std::move(props), from, to]() mutable
                  { return ctx.storage.addEdge(ctx.txn, ctx.arena, label, std::move(props), from, to); });
    }

  } // namespace ops

} // namespace quasar
