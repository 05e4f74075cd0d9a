#pragma once

#include <optional>

#include "common/models.hpp"

namespace jobhist {

// Pull-based, single-pass record sequence. next() returns nullopt once
// exhausted and keeps returning nullopt afterwards.
class RecordSource {
public:
    virtual ~RecordSource() = default;
    virtual std::optional<Record> next() = 0;
};

} // namespace jobhist
