#ifndef AUDIOTAP_BACKEND_TEST_HELPERS_HH
#define AUDIOTAP_BACKEND_TEST_HELPERS_HH

#include <audiotap/sdk/capture_backend.hh>
#include <memory>

namespace audiotap::test {

// Contract checks that work with any capture_backend implementation.
// Checks needing a device are skipped when the backend has none.

// init/shutdown lifecycle, double init throws, double shutdown is safe
void test_backend_initialization(std::unique_ptr<capture_backend> backend);

// Enumerated devices carry the requested source and a usable format
void test_device_enumeration(std::unique_ptr<capture_backend> backend);

// Default input opens, resumes and closes cleanly
void test_stream_open_close(std::unique_ptr<capture_backend> backend);

// Queries before init and unknown ids throw device_error
void test_error_conditions(std::unique_ptr<capture_backend> backend);

} // namespace audiotap::test

#endif // AUDIOTAP_BACKEND_TEST_HELPERS_HH
