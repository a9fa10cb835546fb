#ifndef HULLFORGE_LOG_H_
#define HULLFORGE_LOG_H_

#include <cstdint>
#include <cstdio>
#include <string>

// Structured NDJSON records on stderr, one per line:
//   {"src":"hullforge","event":"<EVENT>","run_id":<generation>}
//   {"src":"hullforge","event":"<EVENT>","run_id":<generation>,"details":"<escaped>"}
//
// run_id is the session geometry generation that produced the record, 0 for
// records not tied to a build (brush and ledger edits outside a session).
//
// Event families:
//   HULL_BUILD_STARTED / HULL_BUILD_DONE / HULL_BUILD_FAILED   hull_geometry.cpp
//   LOD_INTERPOLATE / LOD_INTERPOLATE_SKIPPED / LOD_REJECTED   interpolator.cpp, hull_session.cpp
//   PAINT_STROKE_STARTED / PAINT_STROKE_STOPPED / SELECTION_CLEARED
//                                     paint_selection.cpp, only with ViewerState::debug
//   WEIGHTS_APPLIED / WEIGHTS_CLEARED                          weight_ledger.cpp
//
// Inspecting a demo run:
//   ./hullforge_demo ft 3 2>hullforge.log
//   jq -r 'select(.event=="HULL_BUILD_DONE") | .details' hullforge.log

namespace hullforge {

inline void log_event(const char *event, uint64_t run_id, const char *details = nullptr) {
  if (details && details[0] != '\0') {
    std::fprintf(stderr, "{\"src\":\"hullforge\",\"event\":\"%s\",\"run_id\":%llu,\"details\":\"",
                 event, (unsigned long long)run_id);
    for (const char *p = details; *p != '\0'; ++p) {
      const unsigned char c = (unsigned char)*p;
      if      (c == '"')  std::fputs("\\\"", stderr);
      else if (c == '\\') std::fputs("\\\\", stderr);
      else if (c == '\n') std::fputs("\\n",  stderr);
      else if (c == '\r') std::fputs("\\r",  stderr);
      else if (c == '\t') std::fputs("\\t",  stderr);
      else if (c < 0x20)  std::fprintf(stderr, "\\u%04x", c);
      else                std::fputc(c, stderr);
    }
    std::fputs("\"}\n", stderr);
  } else {
    std::fprintf(stderr, "{\"src\":\"hullforge\",\"event\":\"%s\",\"run_id\":%llu}\n",
                 event, (unsigned long long)run_id);
  }
}

inline void log_event(const char *event, uint64_t run_id, const std::string &details) {
  log_event(event, run_id, details.c_str());
}

// Interaction chatter: written only while the viewer's debug flag is set.
inline void log_debug_event(bool debug, const char *event, uint64_t run_id, const std::string &details) {
  if (debug) log_event(event, run_id, details.c_str());
}

}  // namespace hullforge

#endif  // HULLFORGE_LOG_H_
