#include <audiotap/capture_config.hh>
#include <audiotap/error.hh>
#include <failsafe/failsafe.hh>

#include <cstdlib>

namespace audiotap {
    void capture_config::validate() const {
        if (target_rate == 0) {
            throw config_error("target_rate must be positive");
        }
        if (chunk_size == 0) {
            throw config_error("chunk_size must be positive");
        }
        if (sub_chunks == 0 || sub_chunks > chunk_size) {
            throw config_error("sub_chunks must be between 1 and chunk_size");
        }
        if (ring_blocks < 1) {
            throw config_error("ring_blocks must be at least 1");
        }
        if (max_delivery_frames == 0) {
            throw config_error("max_delivery_frames must be positive");
        }
        if (sink_slots < 2) {
            throw config_error("sink_slots must be at least 2");
        }
    }

    void apply_environment(capture_config& cfg) {
        if (const char* device = std::getenv("AUDIOTAP_DEVICE"); device && *device) {
            cfg.device_id = device;
            LOG_INFO("capture_config", "Device from environment:", cfg.device_id);
        }
        if (const char* source = std::getenv("AUDIOTAP_SOURCE"); source && *source) {
            cfg.source = parse_capture_source(source);
            LOG_INFO("capture_config", "Source from environment:", to_string(cfg.source));
        }
    }
}
