#include "Core.h"

#include <stdexcept>

std::string get_analysis_mode_name(AnalysisMode mode) {
    switch (mode) {
        case AnalysisMode::FILES_AS_ONE:
            return "files_as_one";
        case AnalysisMode::FILES_IN_PARALLEL:
            return "files_in_parallel";
        case AnalysisMode::STREAM:
            return "stream";
    }

    throw std::runtime_error("unhandled analysis mode");
}
