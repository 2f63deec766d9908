#include "Errors.h"

#include <ostream>

namespace gto_broker {

std::string MakeExcerpt(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    static const std::string kMarker = "...[truncated]...";
    if (max_bytes <= kMarker.size()) {
        return text.substr(text.size() - max_bytes);
    }
    std::size_t keep = max_bytes - kMarker.size();
    return kMarker + text.substr(text.size() - keep);
}

std::string ProcessExecutionError::KindToString(Kind kind) {
    switch (kind) {
        case Kind::kNonZeroExit: return "non-zero exit";
        case Kind::kTimeout:     return "timeout";
        case Kind::kTransient:   return "transient failure";
        case Kind::kSpawn:       return "spawn failure";
        case Kind::kWaitTimeout: return "wait timeout";
    }
    return "unknown";
}

int RunReportingErrors(const std::function<int()>& command, std::ostream& err) {
    try {
        return command();
    } catch (const ConfigurationError& e) {
        err << "[ERROR] Invalid " << e.Field() << ": " << e.what() << std::endl;
        return kExitUsage;
    } catch (const NotFoundError& e) {
        err << "[ERROR] Not found: " << e.what() << std::endl;
        return kExitNotFound;
    } catch (const ProcessExecutionError& e) {
        err << "[ERROR] Solver " << ProcessExecutionError::KindToString(e.GetKind()) << ": "
            << e.what() << " (exit status " << e.ExitStatus() << ", attempts "
            << e.Attempts() << ")" << std::endl;
        if (!e.StderrExcerpt().empty()) {
            err << e.StderrExcerpt() << std::endl;
        }
        return kExitProcess;
    } catch (const ParseError& e) {
        err << "[ERROR] Unreadable solver output: " << e.what() << std::endl;
        err << e.Excerpt() << std::endl;
        return kExitParse;
    } catch (const CacheIOError& e) {
        err << "[ERROR] Cache " << e.Path() << ": " << e.what() << std::endl;
        return kExitCacheIO;
    } catch (const std::invalid_argument& e) {
        err << "[ERROR] " << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::exception& e) {
        err << "[ERROR] " << e.what() << std::endl;
        return kExitInternal;
    }
}

} // namespace gto_broker
