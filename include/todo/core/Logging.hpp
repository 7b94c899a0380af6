#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTodoData)
Q_DECLARE_LOGGING_CATEGORY(lcTodoCli)
