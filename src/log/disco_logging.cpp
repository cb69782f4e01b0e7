#include "disco_logging.hpp"

Q_LOGGING_CATEGORY(LC_CODEC,     "disco.codec")
Q_LOGGING_CATEGORY(LC_REGISTRY,  "disco.registry")
Q_LOGGING_CATEGORY(LC_NOTIFY,    "disco.notify")
Q_LOGGING_CATEGORY(LC_LIVENESS,  "disco.liveness")
Q_LOGGING_CATEGORY(LC_OWNER,     "disco.owner")
Q_LOGGING_CATEGORY(LC_SESSION,   "disco.session")
Q_LOGGING_CATEGORY(LC_TRANSPORT, "disco.transport")
Q_LOGGING_CATEGORY(LC_SYSLOG,    "disco.syslog")
