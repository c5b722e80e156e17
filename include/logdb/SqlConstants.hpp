#pragma once

/**
 * Fixed statement shapes for the logging_event tables.
 * Column order is part of the storage contract; readers depend on it.
 */

namespace logdb::sql {

static const char* const INSERT_EVENT =
    "INSERT INTO logging_event ("
    "timestmp, formatted_message, logger_name, level_string, thread_name, "
    "reference_flag, caller_filename, caller_class, caller_method, caller_line) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

static const char* const INSERT_PROPERTY =
    "INSERT INTO logging_event_property (event_id, mapped_key, mapped_value) VALUES (?, ?, ?)";

static const char* const INSERT_EXCEPTION =
    "INSERT INTO logging_event_exception (event_id, i, trace_line) VALUES (?, ?, ?)";

// Parameter positions in INSERT_EVENT
static const int EVENT_TIMESTAMP = 0;
static const int EVENT_FORMATTED_MESSAGE = 1;
static const int EVENT_LOGGER_NAME = 2;
static const int EVENT_LEVEL = 3;
static const int EVENT_THREAD_NAME = 4;
static const int EVENT_REFERENCE_FLAG = 5;
static const int EVENT_CALLER_FILENAME = 6;
static const int EVENT_CALLER_CLASS = 7;
static const int EVENT_CALLER_METHOD = 8;
static const int EVENT_CALLER_LINE = 9;
static const int EVENT_COLUMN_COUNT = 10;

// Parameter positions shared by both child inserts
static const int CHILD_EVENT_ID = 0;
static const int CHILD_KEY = 1;
static const int CHILD_VALUE = 2;

}  // namespace logdb::sql
