#pragma once

#include "csv_encoder.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "fields.hpp"
#include "json_encoder.hpp"
#include "reader.hpp"
#include "record_ref.hpp"
#include "records.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include "writer.hpp"
