#ifndef DSPFLINEFORMAT_H
#define DSPFLINEFORMAT_H

/*
* Copyright 2025 Rochus Keller <mailto:me@rochus-keller.ch>
*
* This file is part of the DspfEdit parser/navigator project.
*
* The following is the license that applies to this copy of the
* file. For a license to use the file under conditions
* other than those described here, please email to me@rochus-keller.ch.
*
* GNU General Public License Usage
* This file may be used under the terms of the GNU General Public
* License (GPL) versions 2.0 or 3.0 as published by the Free Software
* Foundation and appearing in the file LICENSE.GPL included in
* the packaging of this file. Please review the following information
* to ensure GNU General Public Licensing requirements will be met:
* http://www.fsf.org/licensing/licenses/info/GPLv2.html and
* http://www.gnu.org/copyleft/gpl.html.
*/

#include <DspfAst.h>

namespace Dspf
{
    // All offsets are 0-based and relative to the line with the 5 character
    // sequence number area removed.
    struct LineFormat
    {
        enum {
            SeqAreaLen = 5,
            IndicatorsPos = 2, IndicatorsEnd = 11,
            RecordFlagPos = 11,
            NamePos = 13, NameEnd = 23,
            RefFlagPos = 23,
            LengthPos = 27, LengthEnd = 29,
            TypePos = 29,
            DecimalsPos = 30, DecimalsEnd = 32,
            UsagePos = 32,
            RowPos = 34, RowEnd = 37, // overlaps ColPos; kept as observed in existing sources
            ColPos = 36, ColEnd = 39,
            KeywordPos = 39, KeywordEnd = 75,
            LiteralEnd = 79,
            ContinuationPos = 74 // the 80th column of the unstripped line
        };
    };

    class SourceLine
    {
    public:
        explicit SourceLine(const QString& raw);

        const QString& text() const { return d_text; }

        bool isComment() const;
        bool isRecord() const { return at(LineFormat::RecordFlagPos) == QLatin1Char('R'); }
        bool isReferenced() const { return at(LineFormat::RefFlagPos) == QLatin1Char('R'); }
        bool isHidden() const { return usage() == QLatin1Char('H'); }
        bool continues() const { return at(LineFormat::ContinuationPos) == QLatin1Char('-'); }

        QString indicatorSegment() const { return slice(LineFormat::IndicatorsPos, LineFormat::IndicatorsEnd); }
        QString name() const { return slice(LineFormat::NamePos, LineFormat::NameEnd).trimmed(); }
        QString lengthDigits() const { return slice(LineFormat::LengthPos, LineFormat::LengthEnd).trimmed(); }
        QChar type() const { return at(LineFormat::TypePos); }
        QString decimalsDigits() const { return slice(LineFormat::DecimalsPos, LineFormat::DecimalsEnd).trimmed(); }
        QChar usage() const { return at(LineFormat::UsagePos); }
        QString rowDigits() const { return slice(LineFormat::RowPos, LineFormat::RowEnd).trimmed(); }
        QString colDigits() const { return slice(LineFormat::ColPos, LineFormat::ColEnd).trimmed(); }
        QString keywordArea() const { return slice(LineFormat::KeywordPos, LineFormat::KeywordEnd); }
        QString literalArea() const { return slice(LineFormat::KeywordPos, LineFormat::LiteralEnd); }

        quint16 row() const { return toNumber(rowDigits()); }
        quint16 col() const { return toNumber(colDigits()); }

        QString slice(int from, int to) const;
        QChar at(int pos) const;

        static int toNumber(const QString& digits, bool* ok = 0);
    private:
        QString d_text;
    };

    class LineFormatter
    {
    public:
        struct Merged
        {
            QString text; // trimmed
            int lastLine;
            Merged(const QString& t = QString(), int l = -1):text(t),lastLine(l) {}
        };

        // splits on \n and \r\n; a trailing newline yields an empty last line
        static QStringList splitLines(const QString& text);

        // three 3 char slots of sign plus 2 digit number; blank or invalid slots are skipped
        static Indicators decodeIndicators(const QString& segment);

        static Merged mergeConstant(const QStringList& lines, int start);
        static Merged mergeKeywords(const QStringList& lines, int start);
    };
}

#endif // DSPFLINEFORMAT_H
