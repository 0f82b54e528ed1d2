#pragma once
#include <QByteArray>
#include <QException>
#include <QString>

/**
 * Exception carried through QFuture chains when a workbench collaborator fails.
 * Derives from QException so it survives QtConcurrent and QPromise unchanged.
 */
class WorkbenchError : public QException {
public:
    enum class Code {
        Unknown,
        FileNotFound,
        UnsupportedScheme,
        ContentResolveFailed,
        BackupFailed,
        WorkspaceCreateFailed,
        WindowOpenFailed
    };

    WorkbenchError(Code code, const QString& message);

    Code code() const { return m_code; }
    QString message() const { return m_message; }

    const char* what() const noexcept override { return m_what.constData(); }
    void raise() const override { throw *this; }
    WorkbenchError* clone() const override { return new WorkbenchError(*this); }

    static QString codeName(Code code);

private:
    Code m_code = Code::Unknown;
    QString m_message;
    QByteArray m_what;
};
