#include "core/types.hpp"
#include <fmt/format.h>

namespace core {

std::string describe(const TradeIntent& t) {
    if (t.action == Action::Close)
        return fmt::format("CLOSE {} {} ({} orders)", to_string(t.mode), to_string(t.side), t.orders);
    return fmt::format("OPEN {} {} {:+.3f}", to_string(t.mode), to_string(t.side), t.size_fraction);
}

} // namespace core
