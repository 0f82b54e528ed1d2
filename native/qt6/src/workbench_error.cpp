#include "workbench_error.h"

WorkbenchError::WorkbenchError(Code code, const QString& message)
    : m_code(code)
    , m_message(message)
    , m_what(QString("%1: %2").arg(codeName(code), message).toUtf8())
{
}

QString WorkbenchError::codeName(Code code)
{
    switch (code) {
        case Code::Unknown: return "Unknown";
        case Code::FileNotFound: return "FileNotFound";
        case Code::UnsupportedScheme: return "UnsupportedScheme";
        case Code::ContentResolveFailed: return "ContentResolveFailed";
        case Code::BackupFailed: return "BackupFailed";
        case Code::WorkspaceCreateFailed: return "WorkspaceCreateFailed";
        case Code::WindowOpenFailed: return "WindowOpenFailed";
    }
    return "Unknown";
}
