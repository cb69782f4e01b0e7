#include <QCoreApplication>
#include <QLoggingCategory>
#include <QDebug>
#include <exception>
#include "include/common_path.hpp"
#include "config/DiscoveryParams.hpp"
#include "presenter/DiscoveryPresenter.hpp"
#include "services/QSqliteService.hpp"
#include "services/SqlCommon.hpp"
#include "log/SystemLogger.hpp"

int main(int argc, char *argv[]) 
{
		try {	
				QCoreApplication app(argc, argv);

				qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));
				QLoggingCategory::setFilterRules(
						"disco.codec.debug=false\n"
						"disco.registry.debug=false\n"
						"disco.notify.debug=false\n"
						"disco.liveness.debug=false\n"
						"disco.owner.debug=false\n"
						"disco.session.debug=false\n"
						"disco.transport.debug=false\n"
						"disco.syslog.debug=false\n"
				);

				// 설정: deviceDiscovery [config.json]
				const QString cfgPath = argc > 1
						? QString::fromLocal8Bit(argv[1])
						: QStringLiteral(DEVDISCO_CONFIG_PATH DEVDISCO_CONFIG);
				DiscoveryParams params;
				if (!loadDiscoveryParams(cfgPath, &params))
						qInfo() << "[main] using default parameters (" << cfgPath << "not loaded)";

				if (params.personId.isEmpty()) {
						qCritical() << "[main] person_id is not configured";
						return -1;
				}
				if (!params.dbFile.isEmpty())
						SqlCommon::dbFileOverride() = params.dbFile;

                // DB 준비
                QSqliteService svc;
                if (!svc.initializeDatabase()) {
                    qCritical() << "데이터베이스 초기화 실패";
                    return -1;
                }

                // 시스템로거 준비
                SystemLogger::init(sysLogLevelFromString(params.logLevel));
                SystemLogger::info("APP", "Logger initialized");

				DiscoveryPresenter presenter(params);

				QObject::connect(&app, &QCoreApplication::aboutToQuit, [&presenter]{
						presenter.stop();
						SystemLogger::info("APP", "aboutToQuit");
						SystemLogger::shutdown();
				});

				if (!presenter.start() && !params.forciblyDisabled) {
						qCritical() << "[main] discovery could not start";
						SystemLogger::shutdown();
						return -1;
				}
				return app.exec();
		} catch (const std::exception& e) {
				qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
		} catch (...) {
				qCritical() << "[" << __func__ << "] Unknown fatal exception!";
		}

		return -1;
}
