#include "log/compose_logging.hpp"

Q_LOGGING_CATEGORY(LC_DETECT,   "framecoach.detect")
Q_LOGGING_CATEGORY(LC_COMPOSE,  "framecoach.compose")
Q_LOGGING_CATEGORY(LC_PIPELINE, "framecoach.pipeline")
Q_LOGGING_CATEGORY(LC_CAPTURE,  "framecoach.capture")
