#pragma once

// Common path
#define DEVDISCO_ROOT							"/var/lib/deviceDiscovery/"
#define DEVDISCO_ASSERT							DEVDISCO_ROOT "assert/"

// Config
#define DEVDISCO_CONFIG_PATH					DEVDISCO_ROOT "config/"
#define DEVDISCO_CONFIG							"discovery.json"

// Sqlite DB
#define DEVDISCO_DB_PATH						DEVDISCO_ASSERT "db/"
#define DEVDISCO_DB								"devices.db"
