#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QFile>
#include <QMutex>

// Routes qDebug()/qWarning() output to a session log file while still
// passing it to the previous handler (console).
class Logger
{
public:
    static bool init(const QString& filePath);
    static void shutdown();
    static QString logFilePath();

    // When off, debug-level lines (per-tick traces) are kept out of the file
    static void setVerbose(bool verbose);

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);
    static bool shouldFilter(QtMsgType type, const QString& msg);

    static QFile* s_file;
    static QMutex s_mutex;
    static QString s_filePath;
    static bool s_verbose;
    static QtMessageHandler s_originalHandler;
    static bool s_installed;
};

#endif // LOGGER_H
