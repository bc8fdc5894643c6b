#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "Types.h"

namespace slickwatch {

struct RetentionPolicy {
    size_t max_retained_frames = 12;   // 12 fills the result grid, 20 for the paged report
    bool   require_detection   = true; // only frames with at least one detection
};

/* FrameStore: bounded, append-only buffer of retained frame pairs
*
*  - greedy and online: a frame is judged when offered, never later
*  - a frame rejected at offer time is never reconsidered, even if a
*    "better" frame shows up once the store is full
*  - retained indices are strictly increasing
*/
class FrameStore {
public:
    explicit FrameStore(const RetentionPolicy& policy = RetentionPolicy{});

    // would offer() accept a frame with this index / detection state?
    bool accepts(int64_t frame_index, bool has_detection) const;

    // takes ownership when accepted; the record is left untouched otherwise
    bool offer(FrameRecord&& rec);

    const std::vector<FrameRecord>& retainedFrames() const { return frames_; }
    size_t size() const { return frames_.size(); }
    size_t capacity() const { return policy_.max_retained_frames; }
    bool full() const { return frames_.size() >= policy_.max_retained_frames; }
    const RetentionPolicy& policy() const { return policy_; }

private:
    RetentionPolicy policy_;
    std::vector<FrameRecord> frames_;
};

} // namespace slickwatch
