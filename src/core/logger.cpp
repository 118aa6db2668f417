#include "logger.h"
#include <QDateTime>
#include <QTextStream>
#include <QDir>
#include <QFileInfo>
#include <QCoreApplication>

QFile* Logger::s_file = nullptr;
QMutex Logger::s_mutex;
QString Logger::s_filePath;
bool Logger::s_verbose = true;
QtMessageHandler Logger::s_originalHandler = nullptr;
bool Logger::s_installed = false;

bool Logger::init(const QString& filePath)
{
    QMutexLocker lock(&s_mutex);

    if (s_file) {
        return true;
    }

    QFileInfo fi(filePath);
    if (!QDir().mkpath(fi.absolutePath())) {
        return false;
    }

    s_file = new QFile(filePath);
    if (!s_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        delete s_file;
        s_file = nullptr;
        return false;
    }
    s_filePath = filePath;

    QTextStream stream(s_file);
    stream << "\n========================================\n";
    stream << "RegenLab session: " << QDateTime::currentDateTime().toString(Qt::ISODate);
    if (!QCoreApplication::applicationVersion().isEmpty()) {
        stream << " (v" << QCoreApplication::applicationVersion() << ")";
    }
    stream << "\n";
    stream << "========================================\n";
    s_file->flush();

    s_originalHandler = qInstallMessageHandler(messageHandler);
    s_installed = true;
    return true;
}

void Logger::shutdown()
{
    QMutexLocker lock(&s_mutex);

    // A null previous handler restores Qt's default one
    if (s_installed) {
        qInstallMessageHandler(s_originalHandler);
        s_originalHandler = nullptr;
        s_installed = false;
    }

    if (s_file) {
        s_file->close();
        delete s_file;
        s_file = nullptr;
    }
}

QString Logger::logFilePath()
{
    return s_filePath;
}

void Logger::setVerbose(bool verbose)
{
    QMutexLocker lock(&s_mutex);
    s_verbose = verbose;
}

bool Logger::shouldFilter(QtMsgType type, const QString& msg)
{
    if (type == QtDebugMsg && !s_verbose) {
        return true;
    }

    // QSettings complains once per missing key on some platforms
    if (msg.startsWith("QSettings::value")) {
        return true;
    }

    return false;
}

void Logger::messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    // Format: [HH:mm:ss.zzz] LEVEL: message
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    QString level;
    switch (type) {
        case QtDebugMsg:    level = "DEBUG"; break;
        case QtInfoMsg:     level = "INFO"; break;
        case QtWarningMsg:  level = "WARN"; break;
        case QtCriticalMsg: level = "ERROR"; break;
        case QtFatalMsg:    level = "FATAL"; break;
    }

    QString line = QString("[%1] %2: %3").arg(timestamp, level, msg);

    {
        QMutexLocker lock(&s_mutex);
        if (!shouldFilter(type, msg) && s_file && s_file->isOpen()) {
            QTextStream stream(s_file);
            stream << line << "\n";
            s_file->flush();
        }
    }

    if (s_originalHandler) {
        s_originalHandler(type, context, msg);
    }
}
