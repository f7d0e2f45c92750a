#pragma once

#include "jbind_binder.hpp"

namespace jbind
{

  /*

  Polymorphic objects

  The discriminator may come anywhere inside the object. Members seen before it
  are recorded as raw token spans, then replayed against the schema of the
  selected subtype. Members after it bind directly from the live stream.

  */

  //---------------------------------------------------------------------------------------------------------------------
  inline Error Binder::bindPolymorphic(TokenStream& ts, const Type& type, const PointerAdapter& pointer, void* slot)
  {
    if (ts.currentToken() != TokenType::ObjectBegin)
      return ts.makeError(Error::ObjectExpected);

    const PolymorphicSchema& polymorphic = type.polymorphic();
    const std::string& discriminatorKey = polymorphic.discriminatorKey();

    TokenSpan replay;
    const PolymorphicSchema::Subtype* subtype = nullptr;

    while (!subtype)
    {
      if (auto err = ts.nextToken())
        return err;

      if (ts.currentToken() == TokenType::ObjectEnd)
      {
        return ts.makeError(Error::MissingDiscriminator, "heterogeneous schema without type field specified ('" + discriminatorKey + "' in " +
                                                           polymorphic.host().declaration().name + ")");
      }

      if (ts.currentToken() != TokenType::FieldName)
        return ts.makeError(Error::UnexpectedEnd);

      bool isDiscriminator = ts.text() == discriminatorKey;
      replay.push_back({TokenType::FieldName, ts.text(), ts.line(), ts.column()});

      if (auto err = ts.nextToken())
        return err;

      if (isDiscriminator)
      {
        if (ts.currentToken() == TokenType::Null)
          return detail::WithPath(ts.makeError(Error::MissingDiscriminator, "discriminator is null"), discriminatorKey);

        if (!detail::IsScalarToken(ts.currentToken()))
          return detail::WithPath(ts.makeError(Error::UnknownDiscriminator, "discriminator must be a scalar"), discriminatorKey);

        subtype = polymorphic.find(ts.text());
        if (!subtype)
        {
          return detail::WithPath(ts.makeError(Error::UnknownDiscriminator,
                                               "'" + ts.text() + "' is not one of: " + polymorphic.knownValues()),
                                  discriminatorKey);
        }
      }

      if (auto err = RecordValue(ts, replay))
        return err;
    }

    const ClassSchema* schema = nullptr;
    if (auto err = SchemaFor(types::Object(subtype->ref), schema))
    {
      err.line = ts.line();
      err.column = ts.column();
      return err;
    }

    std::shared_ptr<void> created = subtype->create();
    void* obj = subtype->toSubtype(created.get());
    pointer.reset(slot, std::move(created));

    replay.push_back({TokenType::ObjectEnd, {}, ts.line(), ts.column()});

    BufferedTokenStream buffered(std::move(replay));
    if (auto err = bindObjectFields(buffered, *schema, obj))
      return err;

    if (m_stopped)
      return {Error::None};

    return bindObjectFields(ts, *schema, obj, discriminatorKey);
  }

} // namespace jbind
