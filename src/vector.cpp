#include "vector.hpp"
#include <kj/debug.h>
#include <cmath>

namespace quasar
{

  double cosineDistance(kj::ArrayPtr<const double> a, kj::ArrayPtr<const double> b)
  {
    KJ_REQUIRE(a.size() == b.size(), "vector dimension mismatch", a.size(), b.size());

    double dot = 0.0;
    double na = 0.0;
    double nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i)
    {
      dot += a[i] * b[i];
      na += a[i] * a[i];
      nb += b[i] * b[i];
    }
    if (na == 0.0 || nb == 0.0)
      return kMaxDistance;

    double sim = dot / (std::sqrt(na) * std::sqrt(nb));
    if (sim > 1.0)
      sim = 1.0;
    else if (sim < -1.0)
      sim = -1.0;
    return kOrthogonal - sim;
  }

} // namespace quasar
