#pragma once
#include <QDir>
#include <QFileInfo>
#include <QString>
#include <QThread>
#include "include/common_path.hpp"

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("devdisco"); }

	// main 에서 설정 파일 값으로 덮어쓸 수 있음
	inline QString& dbFileOverride()
	{
		static QString path;
		return path;
	}

    inline QString dbFilePath()
    {
        const QString& custom = dbFileOverride();
        if (!custom.isEmpty()) {
            QDir().mkpath(QFileInfo(custom).absolutePath());
            return custom;
        }
        const QString dir = QStringLiteral(DEVDISCO_DB_PATH);
        QDir().mkpath(dir);
        return dir + QStringLiteral(DEVDISCO_DB);
    }

    inline QString connectionNameForCurrentThread()
    {
        return QString("%1_%2").arg(baseConnName())
							   .arg(static_cast<qulonglong>(reinterpret_cast<quintptr>(QThread::currentThreadId())));
    }
} // namespace SqlCommon
