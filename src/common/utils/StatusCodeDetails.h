// Included by StatusCode.h and StatusCode.cc with RAW_STATUS/STATUS defined.

// common
RAW_STATUS(OK, 0)
RAW_STATUS(InvalidArg, 2)
RAW_STATUS(IOError, 4)
RAW_STATUS(UnknownError, 999)

// config
RAW_STATUS(ConfigInvalidType, 1001)
RAW_STATUS(ConfigInvalidValue, 1002)
RAW_STATUS(ConfigParseError, 1003)
RAW_STATUS(ConfigKeyNotFound, 1004)
RAW_STATUS(ConfigRedundantKey, 1005)
RAW_STATUS(ConfigValidateFailed, 1006)
RAW_STATUS(ConfigUpdateFailed, 1007)

// migration
STATUS(Migration, UnknownTarget, 8001)
STATUS(Migration, StateInconsistent, 8002)
STATUS(Migration, InvalidTaskId, 8003)
STATUS(Migration, MalformedInputLine, 8004)
STATUS(Migration, FillLevelQueryFailed, 8005)
STATUS(Migration, TaskExecutionFailed, 8006)
