#pragma once

// Process-wide interruption request, set from SIGINT/SIGTERM handlers.
void RequestStop();
bool StopRequested();
void ResetStop();

void InstallStopHandlers();
