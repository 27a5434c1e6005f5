/**
 * @file sdl3_backend_factory.cc
 * @brief SDL3 backend factory implementation
 * @ingroup sdl3_backend
 */

#include <audiotap_backends/sdl3/sdl3_backend.hh>
#include "sdl3_backend_impl.hh"

namespace audiotap {

std::unique_ptr<capture_backend> create_sdl3_backend() {
    return std::make_unique<sdl3_backend>();
}

} // namespace audiotap
