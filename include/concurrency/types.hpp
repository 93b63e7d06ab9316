#pragma once

#include <memory>
#include <variant>

namespace nx::scan::model { struct DiskNode; }

typedef std::variant<bool, std::shared_ptr<nx::scan::model::DiskNode>> ExpectedFuture;
