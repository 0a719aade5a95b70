#pragma once

// Installs the "praymodoro" stdout logger as spdlog's default.
// Level defaults to info and can be overridden with SPDLOG_LEVEL.
void initLogging();
