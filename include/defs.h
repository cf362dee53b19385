#pragma once
#include <vector>
#include <cstdio>
#include <cstddef>

#define INFO      "\033[32m[   INFO   ]\033[0m "
#define ERROR   "\033[1;31m[   ERROR  ]\033[0m "
#define WARNING   "\033[33m[  WARNING ]\033[0m "
#define SANDBOX   "\033[35m[  SANDBOX ]\033[0m "

#define DEFAULT_TIMEOUT_MS        100  // wall-clock budget for a single pattern
#define DEFAULT_HOOK_INTERVAL     100  // VM instructions between deadline checks
#define DEFAULT_MEMORY_LIMIT      (8 << 20) // bytes one sandbox state may hold
#define DEFAULT_MAX_SCRIPT_LENGTH 1000
#define DEFAULT_DB_PATH           "patterns.db"
#define LOG_LINE_LIMIT            200  // script log() output is cut off here


struct ChartValue; // forward-declarations for everything. this keeps the dependency web small
struct ChartNode;
struct ChartContext;
struct GuardProxy;
struct GuardedView;
struct SandboxExecutor;
struct PatternStore;
struct Pattern;
struct PatternEvaluationCoordinator;
struct Session;
