#pragma once

#include <wsarrow/backend/backend.hpp>
#include <wsarrow/batch/batch.hpp>
#include <wsarrow/config/config.hpp>
#include <wsarrow/core/error.hpp>
#include <wsarrow/core/layout.hpp>
#include <wsarrow/core/types.hpp>
#include <wsarrow/engine/engine.hpp>
#include <wsarrow/io/reader.hpp>
#include <wsarrow/io/writer.hpp>
#include <wsarrow/query/query.hpp>
#include <wsarrow/record/parser.hpp>
#include <wsarrow/schema/resolver.hpp>
#include <wsarrow/transport/http.hpp>
