#include "healrun/config/schema.hpp"

namespace healrun::config {

std::string json_schema() {
  return R"JSON({
  "$schema": "https://json-schema.org/draft/2020-12/schema",
  "$id": "https://healrun.dev/schemas/config.schema.json",
  "title": "healrun Config",
  "type": "object",
  "additionalProperties": true,
  "properties": {
    "retry": {
      "type": "object",
      "properties": {
        "max_retries": {"type": "integer", "minimum": 0, "maximum": 20},
        "backoff_base_ms": {"type": "integer", "minimum": 0},
        "backoff_cap_ms": {"type": "integer", "minimum": 0, "maximum": 86400000}
      }
    },
    "resolver": {
      "type": "object",
      "properties": {
        "existence_probe_timeout_ms": {"type": "integer", "minimum": 1, "maximum": 86400000}
      }
    },
    "ranker": {
      "type": "object",
      "properties": {
        "freshness_window_ms": {"type": "integer", "minimum": 0},
        "recency_bonus": {"type": "number", "minimum": 0.0, "maximum": 1.0}
      }
    },
    "execution": {
      "type": "object",
      "properties": {
        "max_concurrent_test_cases": {"type": "integer", "minimum": 1},
        "per_test_case_deadline_ms": {"type": "integer", "minimum": 0, "maximum": 86400000},
        "post_action_settle_ms": {"type": "integer", "minimum": 0, "maximum": 86400000},
        "isolate_candidate_stores": {"type": "boolean"}
      }
    },
    "replay": {
      "type": "object",
      "properties": {
        "runs": {"type": "integer", "minimum": 1},
        "rerun_failed": {"type": "boolean"}
      }
    },
    "observability": {
      "type": "object",
      "properties": {
        "backend": {"type": "string", "enum": ["log", "none"]}
      }
    },
    "fallbacks": {
      "type": "object",
      "additionalProperties": {
        "type": "object",
        "properties": {
          "candidates": {"type": "array", "items": {"type": "string"}},
          "confidence": {"type": "number", "minimum": 0.0, "maximum": 1.0}
        }
      }
    }
  }
})JSON";
}

} // namespace healrun::config
