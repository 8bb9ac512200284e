#include <sophon/manifest/manifest-decoder.hxx>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <stdexcept>

#include <google/protobuf/message.h>
#include <google/protobuf/unknown_field_set.h>

#include <sophon/sophon-error.hxx>
#include <sophon/hash/hash.hxx>
#include <sophon/manifest/sophon-manifest.pb.h>

using namespace std;

namespace sophon
{
  static string
  lower (const string& s)
  {
    string r (s);

    for (char& c: r)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    return r;
  }

  // Reject records with fields we don't know about. A newer manifest
  // revision could change the meaning of the ones we do.
  //
  static void
  check_unknown (const google::protobuf::Message& m, const string& what)
  {
    if (!m.GetReflection ()->GetUnknownFields (m).empty ())
      throw_malformed ("unknown record field in " + what);
  }

  manifest
  decode_manifest (string_view b, chunk_compression cc, chunk_encryption ce)
  {
    proto::Manifest pm;

    if (b.size () > static_cast<size_t> (INT_MAX) ||
        !pm.ParseFromArray (b.data (), static_cast<int> (b.size ())))
      throw_malformed ("truncated or invalid record stream");

    check_unknown (pm, "manifest");

    manifest m;
    m.files.reserve (pm.assets_size ());

    for (const proto::Asset& a: pm.assets ())
    {
      const string& p (a.assetname ());

      check_unknown (a, "asset " + p);

      if (!valid_path (p))
        throw_malformed ("invalid file path '" + p + "'");

      if (!valid_md5 (a.assethashmd5 ()))
        throw_malformed ("invalid checksum for " + p);

      file_entry f;
      f.path = p;
      f.size = a.assetsize ();
      f.md5 = lower (a.assethashmd5 ());
      f.type = a.assettype ();
      f.chunks.reserve (a.assetchunks_size ());

      for (const proto::AssetChunk& pc: a.assetchunks ())
      {
        check_unknown (pc, "chunk of " + p);

        chunk c;
        c.id = lower (pc.chunkdecompressedhashmd5 ());

        if (!valid_md5 (c.id))
          throw_malformed ("invalid chunk id in " + p);

        if (pc.chunkname ().empty ())
          throw_malformed ("chunk " + c.id + " has no name");

        if (pc.chunksizedecompressed () == 0)
          throw_malformed ("chunk " + c.id + " is empty");

        if (!pc.chunkcompressedhashmd5 ().empty () &&
            !valid_md5 (pc.chunkcompressedhashmd5 ()))
          throw_malformed ("invalid payload checksum for chunk " + c.id);

        c.url_suffix = pc.chunkname ();
        c.compressed_size = pc.chunksize ();
        c.decompressed_size = pc.chunksizedecompressed ();
        c.compression = cc;
        c.encryption = ce;
        c.compressed_md5 = lower (pc.chunkcompressedhashmd5 ());
        c.compressed_xxh = pc.chunkcompressedhashxxh ();

        f.chunks.push_back (
          chunk_ref {c.id, pc.chunkonfileoffset (), c.decompressed_size});

        m.chunks.push_back (move (c));
      }

      // The record stream does not promise any order of chunks within an
      // asset so sort by offset before checking the placement.
      //
      stable_sort (f.chunks.begin (), f.chunks.end (),
                   [] (const chunk_ref& x, const chunk_ref& y)
                   {
                     return x.offset < y.offset;
                   });

      uint64_t e (0);
      for (const chunk_ref& cr: f.chunks)
      {
        if (cr.offset != e)
          throw_malformed ("chunks of " + p + " are not contiguous");

        if (cr.length > UINT64_MAX - e)
          throw_malformed ("chunks of " + p + " overflow");

        e += cr.length;
      }

      if (e != f.size)
        throw_malformed ("chunks of " + p + " do not add up to its size");

      m.files.push_back (move (f));
    }

    m.link ();
    return m;
  }

  string
  encode_manifest (const manifest& m)
  {
    proto::Manifest pm;

    for (const file_entry& f: m.files)
    {
      proto::Asset* a (pm.add_assets ());
      a->set_assetname (f.path);
      a->set_assetsize (f.size);
      a->set_assethashmd5 (f.md5);
      a->set_assettype (f.type);

      for (const chunk_ref& cr: f.chunks)
      {
        const chunk* c (m.find_chunk (cr.id));

        if (c == nullptr)
          throw invalid_argument ("undeclared chunk " + cr.id + " in " +
                                  f.path);

        proto::AssetChunk* pc (a->add_assetchunks ());
        pc->set_chunkname (c->url_suffix);
        pc->set_chunkdecompressedhashmd5 (c->id);
        pc->set_chunkonfileoffset (cr.offset);
        pc->set_chunksize (c->compressed_size);
        pc->set_chunksizedecompressed (c->decompressed_size);
        pc->set_chunkcompressedhashxxh (c->compressed_xxh);
        pc->set_chunkcompressedhashmd5 (c->compressed_md5);
      }
    }

    string r;
    if (!pm.SerializeToString (&r))
      throw runtime_error ("unable to serialize manifest");

    return r;
  }
}
