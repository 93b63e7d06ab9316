#pragma once

namespace nx::runtime { class Core; }

namespace nx::cli {

class Router;

void registerCommands(Router& router, const runtime::Core& core);

}
