#ifndef INCLUDE_QJSBOX_LOGGER_H_
#define INCLUDE_QJSBOX_LOGGER_H_

// Replace the default logger with one writing to stderr (stdout carries the protocol)
//   and keep the console mutex consistent across fork().
void InitLogger();

#endif  // INCLUDE_QJSBOX_LOGGER_H_
