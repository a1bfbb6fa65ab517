#ifndef VITAL_LOG_HPP
#define VITAL_LOG_HPP

#include "vital_log/core/log_common.hpp"
#include "vital_log/core/log_level.hpp"
#include "vital_log/core/completion_status.hpp"
#include "vital_log/core/event.hpp"
#include "vital_log/formatter/formatter_interface.hpp"
#include "vital_log/formatter/line_formatter.hpp"
#include "vital_log/transport/transport_interface.hpp"
#include "vital_log/transport/stream_transport.hpp"
#include "vital_log/transport/stdout_transport.hpp"
#include "vital_log/transport/file_transport.hpp"
#include "vital_log/transport/callback_transport.hpp"
#include "vital_log/sink/sink_interface.hpp"
#include "vital_log/sink/writer_sink.hpp"

#endif // VITAL_LOG_HPP
