#include "runtime/state.h"

namespace sitemirror {

std::atomic<bool> g_running_flag{true};
std::atomic<uint64_t> g_total_requests{0};

}  // namespace sitemirror
