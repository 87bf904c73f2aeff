#include <ScalarFusion/map_key_writer.hpp>
#include <ScalarFusion/reader_concept.hpp>
#include <ScalarFusion/value.hpp>
#include <ScalarFusion/value_reader.hpp>
#include <ScalarFusion/value_writer.hpp>
#include <ScalarFusion/writer_concept.hpp>
#include <ScalarFusion/yyjson.hpp>

using namespace ScalarFusion;

// ===== Writers =====
static_assert(writer::WriterLike<ValueWriter<ScalarValue>>);
static_assert(writer::WriterLike<ValueWriter<ScalarValueOrArray>>);
static_assert(writer::WriterLike<MapKeyWriter>);
static_assert(writer::WriterLike<YyjsonWriter>);

// ===== Readers =====
static_assert(reader::ReaderLike<ValueReader<const ScalarValue>>);
static_assert(reader::ReaderLike<ValueReader<ScalarValueOrArray>>);
static_assert(reader::ReaderLike<YyjsonReader>);

// Borrowed value readers hand out views, owned ones move strings out.
static_assert(reader::BorrowingReader<ValueReader<const ScalarValueOrArray>>);
static_assert(!reader::OwningReader<ValueReader<const ScalarValueOrArray>>);
static_assert(reader::OwningReader<ValueReader<ScalarValue>>);
static_assert(!reader::BorrowingReader<ValueReader<ScalarValue>>);

// yyjson strings only leave the document in chunks.
static_assert(!reader::BorrowingReader<YyjsonReader>);
static_assert(!reader::OwningReader<YyjsonReader>);

// ===== Non-conforming types =====
struct NotAWriter {};
static_assert(!writer::is_writer_like_v<NotAWriter>);
static_assert(!reader::is_reader_like_v<NotAWriter>);
