#include "traversal_internal.hpp"
#include "codec.hpp"

namespace quasar
{

  namespace ops
  {

    StreamPtr filterMut(const TraversalContext &ctx, StreamPtr up, MutPredicate pred)
    {
      KJ_REQUIRE(ctx.txn.writable(), "filter_mut needs a write transaction");
      return makeStream([ctx, up = std::move(up), pred = std::move(pred)]() mutable -> std::optional<Item>
                        {
        while (auto item = up->next())
        {
          if (!item->ok())
            return item;
          bool keep = false;
          std::optional<GraphError> err;
          if (detail::capture([&]
                              { keep = pred(item->value(), ctx.txn); },
                              err))
            return Item(std::move(*err));
          if (keep)
            return item;
        }
        return std::nullopt; });
    }

    StreamPtr update(const TraversalContext &ctx, StreamPtr up, Properties props)
    {
      KJ_REQUIRE(ctx.txn.writable(), "update needs a write transaction");
      return makeStream([ctx, up = std::move(up), props = std::move(props)]() mutable -> std::optional<Item>
                        {
        auto item = up->next();
        if (!item || !item->ok())
          return item;
        return detail::guarded([&]
                               {
          const Node *node = std::get_if<Node>(&item->value());
          if (!node)
            throw GraphError(GraphError::Code::Conversion, "update only applies to nodes");
          return ctx.storage.updateNode(ctx.txn, ctx.arena, *node, props); }); });
    }

    namespace
    {
      // Pulls one upstream item, releases upstream and yields what fn makes of it.
      template <typename F>
      StreamPtr upsertOnce(StreamPtr up, F fn)
      {
        return makeStream([up = std::move(up), fn = std::move(fn), done = false]() mutable -> std::optional<Item>
                          {
          if (done)
            return std::nullopt;
          done = true;
          std::optional<Item> item = up->next();
          up.reset();
          if (item && !item->ok())
            return item;
          return detail::guarded([&]
                                 { return fn(item ? &item->value() : nullptr); }); });
      }
    } // namespace

    StreamPtr upsertN(const TraversalContext &ctx, StreamPtr up, std::string label, Properties props)
    {
      KJ_REQUIRE(ctx.txn.writable(), "upsert_n needs a write transaction");
      return upsertOnce(std::move(up), [ctx, label = std::move(label), props = std::move(props)](const TraversalValue *existing) -> TraversalValue
                        {
        if (!existing)
          return ctx.storage.addNode(ctx.txn, ctx.arena, label, props);
        if (auto node = std::get_if<Node>(existing))
          return ctx.storage.updateNode(ctx.txn, ctx.arena, *node, props);
        return TraversalValue(); });
    }

    StreamPtr upsertE(const TraversalContext &ctx, StreamPtr up, std::string label, Properties props, Id from, Id to)
    {
      KJ_REQUIRE(ctx.txn.writable(), "upsert_e needs a write transaction");
      return upsertOnce(std::move(up), [ctx, label = std::move(label), props = std::move(props), from, to](const TraversalValue *existing) -> TraversalValue
                        {
        if (!existing)
          return ctx.storage.addEdge(ctx.txn, ctx.arena, label, props, from, to);
        if (auto edge = std::get_if<Edge>(existing))
          return ctx.storage.updateEdge(ctx.txn, ctx.arena, *edge, props);
        return TraversalValue(); });
    }

    StreamPtr upsertV(const TraversalContext &ctx, StreamPtr up, std::vector<double> query, std::string label,
                      Properties props)
    {
      KJ_REQUIRE(ctx.txn.writable(), "upsert_v needs a write transaction");
      return upsertOnce(std::move(up), [ctx, query = std::move(query), label = std::move(label), props = std::move(props)](const TraversalValue *existing) -> TraversalValue
                        {
        if (!existing)
        {
          const Properties *stored = props.empty() ? nullptr : copyToArena(ctx.arena, props);
          return ctx.storage.vectors().insert(ctx.txn, ctx.arena, kj::ArrayPtr<const double>(query.data(), query.size()),
                                              label, stored, ctx.storage.versionInfo().latest(label));
        }
        if (auto v = std::get_if<HVector>(existing))
        {
          VectorWithoutData meta = ctx.storage.updateVector(ctx.txn, ctx.arena, v->id, props);
          HVector updated = *v;
          updated.version = meta.version;
          updated.properties = meta.properties;
          return updated;
        }
        if (auto w = std::get_if<VectorWithoutData>(existing))
          return ctx.storage.updateVector(ctx.txn, ctx.arena, w->id, props);
        return TraversalValue(); });
    }

    void drop(const TraversalContext &ctx, StreamPtr up)
    {
      KJ_REQUIRE(ctx.txn.writable(), "drop needs a write transaction");
      // materialize first so no cursor of the pipeline is open while deleting
      std::vector<Item> items = detail::drain(up);
      up.reset();

      for (const auto &item : items)
      {
        if (!item.ok())
          continue;
        const TraversalValue &value = item.value();
        if (value.isEmpty())
          continue;
        try
        {
          if (auto n = std::get_if<Node>(&value))
            ctx.storage.dropNode(ctx.txn, n->id);
          else if (auto e = std::get_if<Edge>(&value))
            ctx.storage.dropEdge(ctx.txn, e->id);
          else if (auto v = std::get_if<HVector>(&value))
            ctx.storage.dropVector(ctx.txn, v->id);
          else if (auto w = std::get_if<VectorWithoutData>(&value))
            ctx.storage.dropVector(ctx.txn, w->id);
          else
            throw GraphError(GraphError::Code::Conversion, "drop only applies to nodes, edges and vectors");
        }
        catch (const MdbError &err)
        {
          throw GraphError(err);
        }
      }
    }

  } // namespace ops

} // namespace quasar
