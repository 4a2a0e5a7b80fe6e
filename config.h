#ifndef CONFIG_H
#define CONFIG_H

// compile-time defaults; everything here can be overridden by the JSON configuration file or
// with -D on the compiler command line

#define CLIENT_NAME "hdmi-matrix-bridge"

#ifndef DEFAULT_CONFIG_PATH
#define DEFAULT_CONFIG_PATH "/etc/hdmi-matrix-bridge.json"
#endif

// where the matrix lives if the configuration doesn't say
#ifndef DEFAULT_MATRIX_HOST
#define DEFAULT_MATRIX_HOST "127.0.0.1"
#endif
#ifndef DEFAULT_MATRIX_PORT
#define DEFAULT_MATRIX_PORT 80
#endif

// bound on a whole instruction exchange (connect, send, receive)
#ifndef DEFAULT_TIMEOUT_MS
#define DEFAULT_TIMEOUT_MS 3000
#endif

// poll the matrix every 10 seconds
#ifndef DEFAULT_POLL_INTERVAL
#define DEFAULT_POLL_INTERVAL 10
#endif

// entities go unavailable after this many failed polls in a row
#ifndef DEFAULT_UNAVAILABLE_AFTER
#define DEFAULT_UNAVAILABLE_AFTER 3
#endif

// the matrix needs a moment after power-on before it takes instructions again
#ifndef DEFAULT_POWER_ON_SETTLE_MS
#define DEFAULT_POWER_ON_SETTLE_MS 5000
#endif

// publish a status line every minute even if nothing changed
#ifndef STATUS_INTERVAL
#define STATUS_INTERVAL 60000
#endif

// echo log entries to stderr
#define CONSOLE_LOGGING

#endif
