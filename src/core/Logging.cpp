#include "todo/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcTodoData, "todo.data", QtWarningMsg)
Q_LOGGING_CATEGORY(lcTodoCli, "todo.cli", QtWarningMsg)
