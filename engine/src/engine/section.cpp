// engine/src/engine/section.cpp
#include <tessel/engine/Section.hpp>


namespace tessel::engine {

    const char* exec_path_name(ExecPath p) {
        switch (p) {
            case ExecPath::kSequential: return "sequential";
            case ExecPath::kParallel: return "parallel";
        }
        return "unknown";
    }

} // namespace tessel::engine
